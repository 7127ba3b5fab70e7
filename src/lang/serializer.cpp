#include <akin/lang/serializer.hpp>

namespace akin {

bool needs_separator(const Token& tok, Spacing spacing) {
    if (tok.joint) return false;
    switch (spacing) {
    case Spacing::Spaced: return true;
    case Spacing::Source: return tok.spaced;
    }
    return true;
}

std::string serialize(const TokenSeq& tokens, Spacing spacing) {
    size_t total = 0;
    for (const auto& tok : tokens) total += tok.text.size() + 1;

    std::string out;
    out.reserve(total);
    bool first = true;
    for (const auto& tok : tokens) {
        if (!first && needs_separator(tok, spacing)) out += ' ';
        out += tok.text;
        first = false;
    }
    return out;
}

} // namespace akin
