#pragma once

#include <akin/lang/token.hpp>
#include <akin/options.hpp>
#include <string>

namespace akin {

// True when a separator goes before `tok` (which is not the first token)
bool needs_separator(const Token& tok, Spacing spacing);

// Flatten expanded tokens into text. One space separates tokens unless
// the right-hand token is joint (or, with Spacing::Source, was adjacent
// to its predecessor in the source). Literals are emitted verbatim.
std::string serialize(const TokenSeq& tokens, Spacing spacing = Spacing::Spaced);

} // namespace akin
