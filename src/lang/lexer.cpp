#include <akin/lang/lexer.hpp>
#include <cctype>
#include <string_view>

namespace akin {

// ---------------------------------------------------------------------------
// Token helpers
// ---------------------------------------------------------------------------

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Identifier:  return "Identifier";
    case TokenKind::Literal:     return "Literal";
    case TokenKind::Punctuation: return "Punctuation";
    case TokenKind::GroupOpen:   return "GroupOpen";
    case TokenKind::GroupClose:  return "GroupClose";
    }
    return "Unknown";
}

const char* delimiter_name(Delimiter d) {
    switch (d) {
    case Delimiter::None:    return "None";
    case Delimiter::Paren:   return "Paren";
    case Delimiter::Bracket: return "Bracket";
    case Delimiter::Brace:   return "Brace";
    }
    return "Unknown";
}

char open_char(Delimiter d) {
    switch (d) {
    case Delimiter::None:    return '\0';
    case Delimiter::Paren:   return '(';
    case Delimiter::Bracket: return '[';
    case Delimiter::Brace:   return '{';
    }
    return '\0';
}

char close_char(Delimiter d) {
    switch (d) {
    case Delimiter::None:    return '\0';
    case Delimiter::Paren:   return ')';
    case Delimiter::Bracket: return ']';
    case Delimiter::Brace:   return '}';
    }
    return '\0';
}

bool Token::is_string() const {
    if (kind != TokenKind::Literal) return false;
    size_t i = 0;
    while (i < text.size() && (text[i] == 'b' || text[i] == 'c' || text[i] == 'r')) ++i;
    while (i < text.size() && text[i] == '#') ++i;
    return i < text.size() && text[i] == '"';
}

bool Token::is_number() const {
    if (kind != TokenKind::Literal || text.empty()) return false;
    size_t i = (text[0] == '-') ? 1 : 0;
    return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]));
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

// Longest first: a prefix must never shadow a longer operator
const char* const kOperators[] = {
    "..=", "...", "<<=", ">>=",
    "::", "->", "=>", "==", "!=", "<=", ">=", "&&", "||",
    "+=", "-=", "*=", "/=", "%=", "^=", "&=", "|=", "<<", ">>", "..",
};

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Bytes >= 0x80 belong to UTF-8 sequences and are accepted in identifiers
bool is_ident_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
}

// Length of the UTF-8 sequence introduced by lead byte `c`
size_t utf8_len(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80) return 1;
    if ((u & 0xE0) == 0xC0) return 2;
    if ((u & 0xF0) == 0xE0) return 3;
    if ((u & 0xF8) == 0xF0) return 4;
    return 1;
}

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;

    // Metadata for the next emitted token
    bool pending_space = false;
    bool pending_joint = false;

    std::vector<Token> tokens;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    char peek_at(size_t offset) const {
        return (pos + offset < source.size()) ? source[pos + offset] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++col;  // continuation bytes share the column of their lead byte
        }
        return c;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void emit(TokenKind kind, std::string text, SourcePos p,
              Delimiter delim = Delimiter::None) {
        Token tok;
        tok.kind = kind;
        tok.delim = delim;
        tok.text = std::move(text);
        tok.pos = std::move(p);
        tok.joint = pending_joint;
        tok.spaced = pending_space;
        pending_joint = false;
        pending_space = false;
        tokens.push_back(std::move(tok));
    }

    AkinError syntax_error(const SourcePos& p, const std::string& msg,
                           const std::string& hint = "") const {
        return AkinError{AkinError::Syntax, msg, hint, p.file, p.line, p.col, 1};
    }

    Result<std::vector<Token>> run() {
        while (true) {
            AKIN_TRY(skip_trivia());
            if (at_end()) break;

            auto p = current_pos();
            char c = peek();

            // Joint modifier: only when glued to the token it modifies
            if (c == '~' && pos + 1 < source.size() && !is_space(peek_next())) {
                advance();
                pending_joint = true;
                continue;
            }

            if (c == '"') {
                AKIN_TRY(lex_string(p, ""));
                continue;
            }

            if (c == '\'') {
                AKIN_TRY(lex_quote(p));
                continue;
            }

            if (is_digit(c)) {
                lex_number(p, "");
                continue;
            }

            // Negative number literal, unless the minus is a binary operator
            if (c == '-' && is_digit(peek_next()) && !prev_is_operand()) {
                advance();
                lex_number(p, "-");
                continue;
            }

            if (is_ident_start(c)) {
                AKIN_TRY(lex_identifier(p));
                continue;
            }

            lex_operator(p);
        }

        return Result<std::vector<Token>>::ok(std::move(tokens));
    }

    bool prev_is_operand() const {
        if (tokens.empty()) return false;
        switch (tokens.back().kind) {
        case TokenKind::Identifier:
        case TokenKind::Literal:
        case TokenKind::GroupClose:
            return true;
        case TokenKind::Punctuation:
        case TokenKind::GroupOpen:
            return false;
        }
        return false;
    }

    Status skip_trivia() {
        while (!at_end()) {
            char c = peek();
            if (is_space(c)) {
                advance();
                pending_space = true;
            } else if (c == '/' && peek_next() == '/') {
                while (!at_end() && peek() != '\n') advance();
                pending_space = true;
            } else if (c == '/' && peek_next() == '*') {
                AKIN_TRY(skip_block_comment());
                pending_space = true;
            } else {
                break;
            }
        }
        return ok_status();
    }

    // Block comments nest, as in Rust
    Status skip_block_comment() {
        auto p = current_pos();
        advance(); // /
        advance(); // *
        int depth = 1;
        while (!at_end()) {
            if (peek() == '/' && peek_next() == '*') {
                advance();
                advance();
                ++depth;
            } else if (peek() == '*' && peek_next() == '/') {
                advance();
                advance();
                if (--depth == 0) return ok_status();
            } else {
                advance();
            }
        }
        return syntax_error(p, "unterminated block comment");
    }

    Status lex_string(SourcePos p, std::string prefix) {
        std::string text = std::move(prefix);
        text += advance(); // opening "
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                text += advance();
                if (!at_end()) text += advance();
                continue;
            }
            text += advance();
            if (c == '"') {
                emit(TokenKind::Literal, std::move(text), p);
                return ok_status();
            }
        }
        return syntax_error(p, "unterminated string literal",
                            "add the closing '\"'");
    }

    // At `#...#"` after an r/br/cr prefix (zero or more hashes)
    Status lex_raw_string(SourcePos p, std::string prefix) {
        std::string text = std::move(prefix);
        size_t hashes = 0;
        while (!at_end() && peek() == '#') {
            text += advance();
            ++hashes;
        }
        text += advance(); // opening "
        while (!at_end()) {
            char c = advance();
            text += c;
            if (c != '"') continue;
            size_t n = 0;
            while (n < hashes && peek_at(n) == '#') ++n;
            if (n == hashes) {
                for (size_t i = 0; i < hashes; ++i) text += advance();
                emit(TokenKind::Literal, std::move(text), p);
                return ok_status();
            }
        }
        return syntax_error(p, "unterminated raw string literal",
            "close it with '\"' followed by " + std::to_string(hashes) + " '#'");
    }

    // At a quote: char literal or lifetime/label
    Status lex_quote(SourcePos p) {
        char next = peek_next();
        if (next == '\\') return lex_char(p, "");
        if (next != '\0' && next != '\'' && next != '\n') {
            size_t len = utf8_len(next);
            if (peek_at(1 + len) == '\'') return lex_char(p, "");
        }
        if (is_ident_start(next)) {
            std::string text;
            text += advance(); // '
            while (!at_end() && is_ident_char(peek())) text += advance();
            emit(TokenKind::Identifier, std::move(text), p);
            return ok_status();
        }
        return syntax_error(p, "unterminated char literal",
                            "add the closing '''");
    }

    Status lex_char(SourcePos p, std::string prefix) {
        std::string text = std::move(prefix);
        text += advance(); // opening '
        if (!at_end() && peek() == '\\') {
            text += advance();
            if (!at_end() && peek() != '\n') text += advance();
            // \x41, \u{1F600}: run until the closing quote
            while (!at_end() && peek() != '\'' && peek() != '\n') text += advance();
        } else if (!at_end() && peek() != '\'' && peek() != '\n') {
            size_t len = utf8_len(peek());
            for (size_t i = 0; i < len && !at_end(); ++i) text += advance();
        }
        if (at_end() || peek() != '\'') {
            return syntax_error(p, "unterminated char literal",
                                "add the closing '''");
        }
        text += advance();
        emit(TokenKind::Literal, std::move(text), p);
        return ok_status();
    }

    void consume_number_run(std::string& text, bool hex) {
        while (!at_end() && is_ident_char(peek())) {
            char ch = advance();
            text += ch;
            // Signed exponent: 1e-3, 2.5E+10
            if (!hex && (ch == 'e' || ch == 'E') &&
                (peek_at(0) == '+' || peek_at(0) == '-') && is_digit(peek_at(1))) {
                text += advance();
            }
        }
    }

    void lex_number(SourcePos p, std::string prefix) {
        std::string text = std::move(prefix);
        bool hex = peek() == '0' && (peek_next() == 'x' || peek_next() == 'X');
        consume_number_run(text, hex);

        // Fraction; `0..3` keeps its range operator
        if (!hex && !at_end() && peek() == '.' && is_digit(peek_next())) {
            text += advance(); // .
            consume_number_run(text, false);
        }

        emit(TokenKind::Literal, std::move(text), p);
    }

    Status lex_identifier(SourcePos p) {
        std::string text;
        while (!at_end() && is_ident_char(peek())) {
            text += advance();
        }

        bool raw_prefix = (text == "r" || text == "br" || text == "cr");
        if (raw_prefix && !at_end() && (peek() == '"' || peek() == '#')) {
            size_t hashes = 0;
            while (peek_at(hashes) == '#') ++hashes;
            if (peek_at(hashes) == '"') {
                return lex_raw_string(p, std::move(text));
            }
            // Raw identifier: r#type
            if (text == "r" && hashes == 1 && is_ident_start(peek_at(1))) {
                text += advance(); // #
                while (!at_end() && is_ident_char(peek())) text += advance();
                emit(TokenKind::Identifier, std::move(text), p);
                return ok_status();
            }
        }

        if ((text == "b" || text == "c") && !at_end() && peek() == '"') {
            return lex_string(p, std::move(text));
        }
        if (text == "b" && !at_end() && peek() == '\'') {
            return lex_char(p, std::move(text));
        }

        emit(TokenKind::Identifier, std::move(text), p);
        return ok_status();
    }

    void lex_operator(SourcePos p) {
        char c = peek();
        switch (c) {
        case '(': advance(); emit(TokenKind::GroupOpen,  "(", p, Delimiter::Paren);   return;
        case ')': advance(); emit(TokenKind::GroupClose, ")", p, Delimiter::Paren);   return;
        case '[': advance(); emit(TokenKind::GroupOpen,  "[", p, Delimiter::Bracket); return;
        case ']': advance(); emit(TokenKind::GroupClose, "]", p, Delimiter::Bracket); return;
        case '{': advance(); emit(TokenKind::GroupOpen,  "{", p, Delimiter::Brace);   return;
        case '}': advance(); emit(TokenKind::GroupClose, "}", p, Delimiter::Brace);   return;
        default: break;
        }

        for (const char* op : kOperators) {
            std::string_view sv(op);
            if (source.compare(pos, sv.size(), sv) == 0) {
                for (size_t i = 0; i < sv.size(); ++i) advance();
                emit(TokenKind::Punctuation, std::string(sv), p);
                return;
            }
        }

        emit(TokenKind::Punctuation, std::string(1, advance()), p);
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<Token>> lex(const std::string& source,
                               const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace akin
