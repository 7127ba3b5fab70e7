#pragma once

#include <akin/lang/ast.hpp>
#include <akin/options.hpp>
#include <akin/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace akin {

// ---------------------------------------------------------------------------
// Scope resolution
// ---------------------------------------------------------------------------

// Distinct variable names referenced directly by `block` (references
// inside its child blocks belong to those blocks), in first-use order.
std::vector<std::string> direct_refs(const Block& block);

// Number of copies `block` expands to: the largest value count among its
// direct references, at least 1. Fails on a name missing from `vars`.
Result<std::size_t> block_factor(const Block& block, const VariableTable& vars);

// Declared variables mentioned as `*name` inside a string literal's text
std::vector<std::string> interpolation_names(const std::string& text,
                                             const VariableTable& vars);

// ---------------------------------------------------------------------------
// Expansion
// ---------------------------------------------------------------------------

// Expand block `id` of `arena` into block_factor() substituted copies.
// Child blocks are expanded once and the same copies are spliced into
// every copy of the parent. Variables with fewer values than the factor
// repeat their last value.
Result<std::vector<TokenSeq>> expand_block(const VariableTable& vars,
                                           const std::vector<Block>& arena,
                                           BlockId id,
                                           const RenderOptions& opts = {});

Result<std::vector<TokenSeq>> expand_block(const Template& tpl, BlockId id,
                                           const RenderOptions& opts = {});

// Expand the root block and concatenate its copies
Result<TokenSeq> expand(const Template& tpl, const RenderOptions& opts = {});

// Append `copies` to `out` in order. The first token of every copy after
// the first non-empty one is marked spaced (unless joint) so neighbouring
// copies never fuse.
void append_copies(TokenSeq& out, const std::vector<TokenSeq>& copies);

} // namespace akin
