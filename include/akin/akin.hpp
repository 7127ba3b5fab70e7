#pragma once

#include <akin/lang/ast.hpp>
#include <akin/options.hpp>
#include <akin/result.hpp>
#include <string>

namespace akin {

// Tokenize `text` and parse its declarations and body.
Result<Template> parse(const std::string& text,
                       const std::string& filename = "<input>",
                       const RenderOptions& opts = {});

// Expand a parsed template and serialize the result.
Result<std::string> expand_and_render(const Template& tpl,
                                      const RenderOptions& opts = {});

// parse() followed by expand_and_render(). Either the whole output or
// the first error, never partial text.
Result<std::string> render(const std::string& text,
                           const std::string& filename = "<input>",
                           const RenderOptions& opts = {});

} // namespace akin
