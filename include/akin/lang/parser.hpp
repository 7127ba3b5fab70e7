#pragma once

#include <akin/lang/ast.hpp>
#include <akin/options.hpp>
#include <akin/result.hpp>
#include <string>
#include <vector>

namespace akin {

// Parse the leading `let &name = ...;` declarations starting at `pos`.
// On success `pos` is left at the first body token. References inside
// `{...}` values are expanded against the variables declared before.
Result<VariableTable> parse_declarations(const std::vector<Token>& tokens,
                                         size_t& pos,
                                         const RenderOptions& opts = {});

// Parse tokens[begin, end) into a block tree appended to `arena` and
// return the root block. Delimiters must pair up by kind; `*name`
// becomes a VariableRef and must name a variable of `vars`.
Result<BlockId> parse_block(const std::vector<Token>& tokens,
                            size_t begin, size_t end,
                            const VariableTable& vars,
                            const RenderOptions& opts,
                            std::vector<Block>& arena);

// Declarations followed by the body
Result<Template> parse_tokens(const std::vector<Token>& tokens,
                              const RenderOptions& opts = {});

} // namespace akin
