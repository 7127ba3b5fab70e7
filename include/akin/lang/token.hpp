#pragma once

#include <string>
#include <vector>

namespace akin {

// Source position for error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

enum class TokenKind {
    Identifier,   // foo, _x, r#type, 'a (lifetime/label)
    Literal,      // 42, -1, 1.5e3, "str", 'c', r#"raw"#
    Punctuation,  // ; , = => :: * & ...
    GroupOpen,    // ( [ {
    GroupClose    // ) ] }
};

enum class Delimiter {
    None,
    Paren,     // ( )
    Bracket,   // [ ]
    Brace      // { }
};

struct Token {
    TokenKind kind = TokenKind::Punctuation;
    Delimiter delim = Delimiter::None;  // set for GroupOpen / GroupClose only
    std::string text;
    SourcePos pos;
    // A `~` joint modifier preceded the token: never separate it from
    // the previous emitted token.
    bool joint = false;
    // Whitespace (or a comment) preceded the token in the source.
    bool spaced = false;

    bool is(TokenKind k, const char* t) const { return kind == k && text == t; }
    bool is_punct(const char* t) const { return is(TokenKind::Punctuation, t); }
    bool is_ident(const char* t) const { return is(TokenKind::Identifier, t); }
    bool is_open(Delimiter d) const { return kind == TokenKind::GroupOpen && delim == d; }
    bool is_close(Delimiter d) const { return kind == TokenKind::GroupClose && delim == d; }

    // Double-quoted string literal, with or without a b/c/r prefix
    bool is_string() const;
    // Number literal (possibly negative)
    bool is_number() const;
};

using TokenSeq = std::vector<Token>;

const char* token_kind_name(TokenKind k);
const char* delimiter_name(Delimiter d);

// Opening / closing character of a delimiter, '\0' for None
char open_char(Delimiter d);
char close_char(Delimiter d);

} // namespace akin
