#include <akin/options.hpp>

namespace akin {

const char* spacing_name(Spacing s) {
    switch (s) {
        case Spacing::Spaced: return "spaced";
        case Spacing::Source: return "source";
    }
    return "unknown";
}

Result<Spacing> parse_spacing(const std::string& name) {
    if (name == "spaced") return Result<Spacing>::ok(Spacing::Spaced);
    if (name == "source") return Result<Spacing>::ok(Spacing::Source);
    return AkinError{AkinError::InvalidArg,
        "unknown spacing mode '" + name + "'",
        "expected \"spaced\" or \"source\""};
}

} // namespace akin
