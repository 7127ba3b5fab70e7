#pragma once

#include <akin/lang/token.hpp>
#include <akin/result.hpp>
#include <string>
#include <vector>

namespace akin {

// Lex template text into tokens. Comments are dropped and count as
// whitespace; `~` directly before a token is consumed and marks that
// token joint. Fails on unterminated string/char literals and block
// comments.
Result<std::vector<Token>> lex(const std::string& source,
                               const std::string& filename = "<input>");

} // namespace akin
