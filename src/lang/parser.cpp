#include <akin/lang/parser.hpp>
#include <akin/lang/expander.hpp>
#include <akin/log.hpp>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace akin {

namespace {

// Deeper nesting is rejected rather than risking the expander's recursion
constexpr size_t kMaxNesting = 256;

AkinError error_at(AkinError::Code code, const SourcePos& p,
                   const std::string& msg, const std::string& hint = "",
                   int length = 1) {
    return AkinError{code, msg, hint, p.file, p.line, p.col, length};
}

std::string quoted(const Token& tok) {
    return "'" + tok.text + "'";
}

// A plain identifier usable as a variable name: not a lifetime, not r#raw
bool is_name(const Token& tok) {
    if (tok.kind != TokenKind::Identifier || tok.text.empty()) return false;
    char c = tok.text[0];
    if (!std::isalpha(static_cast<unsigned char>(c)) && c != '_') return false;
    return tok.text.find('#') == std::string::npos;
}

BlockId new_block(std::vector<Block>& arena) {
    arena.emplace_back();
    return static_cast<BlockId>(arena.size() - 1);
}

// ---------------------------------------------------------------------------
// Declaration parser state machine
// ---------------------------------------------------------------------------

struct DeclParser {
    const std::vector<Token>& tokens;
    const RenderOptions& opts;
    size_t pos;
    VariableTable vars;

    DeclParser(const std::vector<Token>& toks, size_t start,
               const RenderOptions& o)
        : tokens(toks), opts(o), pos(start) {}

    // -- Navigation ---------------------------------------------------------

    bool at_end() const { return pos >= tokens.size(); }

    const Token& peek() const { return tokens[pos]; }

    // Position for diagnostics at index `i`, clamped to the last token
    SourcePos pos_at(size_t i) const {
        if (tokens.empty()) return {};
        return i < tokens.size() ? tokens[i].pos : tokens.back().pos;
    }

    bool at_declaration() const {
        return pos + 1 < tokens.size() &&
               tokens[pos].is_ident("let") &&
               tokens[pos + 1].is_punct("&");
    }

    // -- Groups -------------------------------------------------------------

    // Index of the token closing the group opened at `open`
    Result<size_t> group_end(size_t open) const {
        std::vector<size_t> stack;
        for (size_t i = open; i < tokens.size(); ++i) {
            const Token& tok = tokens[i];
            if (tok.kind == TokenKind::GroupOpen) {
                stack.push_back(i);
            } else if (tok.kind == TokenKind::GroupClose) {
                const Token& opener = tokens[stack.back()];
                if (opener.delim != tok.delim) {
                    return mismatched(opener, tok);
                }
                stack.pop_back();
                if (stack.empty()) return Result<size_t>::ok(i);
            }
        }
        return unclosed(tokens[open]);
    }

    static AkinError mismatched(const Token& opener, const Token& closer) {
        return error_at(AkinError::Syntax, closer.pos,
            "mismatched closing delimiter " + quoted(closer),
            std::string("expected '") + close_char(opener.delim) +
                "' to close " + quoted(opener) + " at line " +
                std::to_string(opener.pos.line) + ", column " +
                std::to_string(opener.pos.col));
    }

    static AkinError unclosed(const Token& opener) {
        return error_at(AkinError::Syntax, opener.pos,
            "unclosed delimiter " + quoted(opener),
            std::string("add a matching '") + close_char(opener.delim) + "'");
    }

    // -- Declarations -------------------------------------------------------

    Status parse_all() {
        while (at_declaration()) {
            AKIN_TRY(parse_declaration());
        }
        return ok_status();
    }

    Status parse_declaration() {
        const Token& let_tok = peek();
        pos += 2; // let &

        if (at_end() || !is_name(peek())) {
            return error_at(AkinError::Syntax, pos_at(pos),
                "expected a variable name after 'let &'");
        }
        const Token& name_tok = peek();
        ++pos;

        if (at_end() || !peek().is_punct("=")) {
            return error_at(AkinError::Syntax, pos_at(pos),
                "expected '=' after variable name '" + name_tok.text + "'");
        }
        ++pos;

        auto values = parse_value_source(name_tok);
        AKIN_TRY(values);

        if (at_end() || !peek().is_punct(";")) {
            return error_at(AkinError::Syntax, pos_at(pos),
                "expected ';' after the declaration of '" + name_tok.text + "'",
                "declarations have the form `let &name = [a, b, c];`");
        }
        ++pos;

        Variable var;
        var.name = name_tok.text;
        var.values = std::move(values).value();
        var.pos = name_tok.pos;
        size_t count = var.values.size();
        AKIN_TRY(vars.declare(std::move(var)));

        log::debug("declared '%s' with %zu value%s (line %d)",
                   name_tok.text.c_str(), count, count == 1 ? "" : "s",
                   let_tok.pos.line);
        return ok_status();
    }

    Result<std::vector<Value>> parse_value_source(const Token& name_tok) {
        if (at_end()) {
            return error_at(AkinError::Syntax, pos_at(pos),
                "expected a value for '" + name_tok.text + "'");
        }
        const Token& tok = peek();

        if (tok.is_open(Delimiter::Bracket)) {
            auto close = group_end(pos);
            AKIN_TRY(close);
            auto values = parse_list(pos + 1, close.value(), tok);
            AKIN_TRY(values);
            pos = close.value() + 1;
            return values;
        }

        if (tok.is_open(Delimiter::Brace)) {
            auto close = group_end(pos);
            AKIN_TRY(close);
            auto value = expand_value(pos + 1, close.value());
            AKIN_TRY(value);
            pos = close.value() + 1;
            std::vector<Value> values;
            values.push_back(std::move(value).value());
            return Result<std::vector<Value>>::ok(std::move(values));
        }

        if (tok.is_ident("NONE")) {
            ++pos;
            return Result<std::vector<Value>>::ok(std::vector<Value>(1));
        }

        if (pos + 1 < tokens.size() &&
            (tokens[pos + 1].is_punct("..") || tokens[pos + 1].is_punct("..="))) {
            return parse_range();
        }

        return error_at(AkinError::Syntax, tok.pos,
            "expected '[', '{', NONE or a range after '=', found " + quoted(tok),
            "e.g. `let &n = [1, 2, 3];`, `let &n = 0..3;` or `let &n = { a + b };`",
            static_cast<int>(tok.text.size()));
    }

    // [begin, end) is the inside of a bracketed list; `open` is its '['
    Result<std::vector<Value>> parse_list(size_t begin, size_t end,
                                          const Token& open) {
        if (begin == end) {
            return error_at(AkinError::Syntax, open.pos,
                "empty value list", "a variable needs at least one value; use NONE for an empty one");
        }

        std::vector<Value> values;
        size_t i = begin;
        while (i < end) {
            size_t j = i;
            int depth = 0;
            while (j < end) {
                const Token& t = tokens[j];
                if (t.kind == TokenKind::GroupOpen) ++depth;
                else if (t.kind == TokenKind::GroupClose) --depth;
                else if (depth == 0 && t.is_punct(",")) break;
                ++j;
            }
            if (j == i) {
                return error_at(AkinError::Syntax, tokens[i].pos,
                    "empty value in list", "remove the extra ','");
            }

            auto value = parse_element(i, j);
            AKIN_TRY(value);
            values.push_back(std::move(value).value());

            i = (j < end) ? j + 1 : j; // skip the comma
        }
        return Result<std::vector<Value>>::ok(std::move(values));
    }

    // One list element: NONE, {tokens}, a single token or a single group
    Result<Value> parse_element(size_t begin, size_t end) {
        const Token& first = tokens[begin];
        if (end - begin == 1) {
            if (first.is_ident("NONE")) return Result<Value>::ok(Value{});
            return expand_value(begin, end);
        }

        if (first.kind == TokenKind::GroupOpen) {
            auto close = group_end(begin);
            AKIN_TRY(close);
            if (close.value() == end - 1) {
                if (first.delim == Delimiter::Brace) {
                    return expand_value(begin + 1, end - 1);
                }
                return expand_value(begin, end);
            }
        }

        const Token& last = tokens[end - 1];
        int length = (last.pos.line == first.pos.line)
            ? last.pos.col + static_cast<int>(last.text.size()) - first.pos.col
            : static_cast<int>(first.text.size());
        return error_at(AkinError::Syntax, first.pos,
            "list value spans more than one token",
            "wrap multi-token values in braces: `{ ... }`", length);
    }

    Result<std::vector<Value>> parse_range() {
        const Token& lo_tok = tokens[pos];
        const Token& op = tokens[pos + 1];
        bool inclusive = op.text == "..=";
        if (pos + 2 >= tokens.size() || tokens[pos + 2].is_punct(";")) {
            return error_at(AkinError::Syntax, op.pos,
                "expected an upper bound after " + quoted(op), "", static_cast<int>(op.text.size()));
        }
        const Token& hi_tok = tokens[pos + 2];

        auto lo = parse_bound(lo_tok);
        AKIN_TRY(lo);
        auto hi = parse_bound(hi_tok);
        AKIN_TRY(hi);

        uint64_t a = lo.value();
        uint64_t b = hi.value();
        if (a > b || (a == b && !inclusive)) {
            return error_at(AkinError::TypeMismatch, lo_tok.pos,
                std::string(a > b ? "descending" : "empty") + " range " +
                    lo_tok.text + op.text + hi_tok.text,
                "ranges count upwards: `low..high` excludes high, `low..=high` includes it",
                hi_tok.pos.col + static_cast<int>(hi_tok.text.size()) - lo_tok.pos.col);
        }

        // b - a + 1 overflows for 0..=u64::MAX, so compare the span
        uint64_t span = b - a;
        bool too_long = inclusive ? span >= opts.max_range_len
                                  : span > opts.max_range_len;
        if (too_long) {
            return error_at(AkinError::LimitExceeded, lo_tok.pos,
                "range " + lo_tok.text + op.text + hi_tok.text + " is longer than " +
                    std::to_string(opts.max_range_len) + " values",
                "raise render.max-range-len in the config");
        }

        uint64_t last = inclusive ? b : b - 1;
        std::vector<Value> values;
        values.reserve(static_cast<size_t>(last - a + 1));
        for (uint64_t v = a;; ++v) {
            Token tok;
            tok.kind = TokenKind::Literal;
            tok.text = std::to_string(v);
            tok.pos = lo_tok.pos;
            values.push_back(Value{tok});
            if (v == last) break;
        }

        pos += 3;
        return Result<std::vector<Value>>::ok(std::move(values));
    }

    static Result<uint64_t> parse_bound(const Token& tok) {
        uint64_t v = 0;
        const char* first = tok.text.data();
        const char* last = first + tok.text.size();
        auto [ptr, ec] = std::from_chars(first, last, v, 10);
        if (tok.kind != TokenKind::Literal || ec == std::errc::invalid_argument ||
            ptr != last) {
            return error_at(AkinError::TypeMismatch, tok.pos,
                "range bound " + quoted(tok) + " is not an unsigned integer",
                "range bounds are non-negative decimal integers",
                static_cast<int>(tok.text.size()));
        }
        if (ec == std::errc::result_out_of_range) {
            return error_at(AkinError::TypeMismatch, tok.pos,
                "range bound " + quoted(tok) + " does not fit in 64 bits", "",
                static_cast<int>(tok.text.size()));
        }
        return Result<uint64_t>::ok(v);
    }

    // Parse and expand tokens[begin, end) into a single value
    Result<Value> expand_value(size_t begin, size_t end) const {
        std::vector<Block> arena;
        auto root = parse_block(tokens, begin, end, vars, opts, arena);
        AKIN_TRY(root);
        auto copies = expand_block(vars, arena, root.value(), opts);
        AKIN_TRY(copies);
        Value value;
        append_copies(value, copies.value());
        return Result<Value>::ok(std::move(value));
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<VariableTable> parse_declarations(const std::vector<Token>& tokens,
                                         size_t& pos,
                                         const RenderOptions& opts) {
    DeclParser parser(tokens, pos, opts);
    AKIN_TRY(parser.parse_all());
    pos = parser.pos;
    return Result<VariableTable>::ok(std::move(parser.vars));
}

Result<BlockId> parse_block(const std::vector<Token>& tokens,
                            size_t begin, size_t end,
                            const VariableTable& vars,
                            const RenderOptions& opts,
                            std::vector<Block>& arena) {
    // Open groups, innermost last
    struct Frame {
        BlockId parent;
        size_t node;   // index of the ChildBlock node in the parent
        size_t open;   // token index of the opening delimiter
    };
    std::vector<Frame> stack;

    BlockId root = new_block(arena);
    BlockId current = root;

    for (size_t i = begin; i < end; ++i) {
        const Token& tok = tokens[i];
        switch (tok.kind) {
        case TokenKind::GroupOpen: {
            if (stack.size() >= kMaxNesting) {
                return error_at(AkinError::LimitExceeded, tok.pos,
                    "delimiters nested more than " + std::to_string(kMaxNesting) +
                        " levels deep");
            }
            BlockId child = new_block(arena);
            ChildBlock node;
            node.open = tok;
            node.block = child;
            arena[current].nodes.push_back(std::move(node));
            stack.push_back({current, arena[current].nodes.size() - 1, i});
            current = child;
            break;
        }
        case TokenKind::GroupClose: {
            if (stack.empty()) {
                return error_at(AkinError::Syntax, tok.pos,
                    "unexpected closing delimiter " + quoted(tok),
                    "no group is open here");
            }
            Frame frame = stack.back();
            const Token& opener = tokens[frame.open];
            if (opener.delim != tok.delim) {
                return DeclParser::mismatched(opener, tok);
            }
            std::get<ChildBlock>(arena[frame.parent].nodes[frame.node]).close = tok;
            current = frame.parent;
            stack.pop_back();
            break;
        }
        case TokenKind::Punctuation: {
            // `*name`: the name must follow the marker directly
            if (tok.text == "*" && i + 1 < end && is_name(tokens[i + 1]) &&
                !tokens[i + 1].spaced && !tokens[i + 1].joint) {
                const Token& name = tokens[i + 1];
                if (!vars.contains(name.text)) {
                    return error_at(AkinError::UndeclaredVariable, tok.pos,
                        "use of undeclared variable '" + name.text + "'",
                        "declare it before use with `let &" + name.text + " = [...];`",
                        static_cast<int>(name.text.size()) + 1);
                }
                VariableRef ref;
                ref.name = name.text;
                ref.pos = tok.pos;
                ref.joint = tok.joint;
                ref.spaced = tok.spaced;
                arena[current].nodes.push_back(std::move(ref));
                ++i;
                break;
            }
            arena[current].nodes.push_back(tok);
            break;
        }
        case TokenKind::Literal: {
            if (opts.interpolate_strings && tok.is_string()) {
                auto names = interpolation_names(tok.text, vars);
                if (!names.empty()) {
                    StringRef str;
                    str.token = tok;
                    str.names = std::move(names);
                    arena[current].nodes.push_back(std::move(str));
                    break;
                }
            }
            arena[current].nodes.push_back(tok);
            break;
        }
        case TokenKind::Identifier:
            arena[current].nodes.push_back(tok);
            break;
        }
    }

    if (!stack.empty()) {
        return DeclParser::unclosed(tokens[stack.back().open]);
    }
    return Result<BlockId>::ok(root);
}

Result<Template> parse_tokens(const std::vector<Token>& tokens,
                              const RenderOptions& opts) {
    size_t pos = 0;
    auto vars = parse_declarations(tokens, pos, opts);
    AKIN_TRY(vars);

    Template tpl;
    tpl.vars = std::move(vars).value();
    auto root = parse_block(tokens, pos, tokens.size(), tpl.vars, opts, tpl.blocks);
    AKIN_TRY(root);
    tpl.root = root.value();

    log::debug("parsed %zu declarations and %zu blocks",
               tpl.vars.size(), tpl.blocks.size());
    return Result<Template>::ok(std::move(tpl));
}

} // namespace akin
