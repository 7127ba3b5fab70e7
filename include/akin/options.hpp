#pragma once

#include <akin/result.hpp>
#include <cstddef>
#include <string>

namespace akin {

// How the serializer separates adjacent tokens.
enum class Spacing {
    Spaced,   // one space before every token that is not joint
    Source    // keep source adjacency: `foo(x)` stays `foo(x)`
};

const char* spacing_name(Spacing s);
Result<Spacing> parse_spacing(const std::string& name);

struct RenderOptions {
    Spacing spacing = Spacing::Spaced;
    // Substitute `*name` inside double-quoted string literals
    bool interpolate_strings = true;
    // Largest number of values a `a..b` / `a..=b` range may produce
    std::size_t max_range_len = 65536;
    // Largest number of tokens one block's copies may hold in total
    std::size_t max_output_tokens = 4194304;
};

} // namespace akin
