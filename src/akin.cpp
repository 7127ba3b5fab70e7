#include <akin/akin.hpp>
#include <akin/lang/expander.hpp>
#include <akin/lang/lexer.hpp>
#include <akin/lang/parser.hpp>
#include <akin/lang/serializer.hpp>
#include <akin/log.hpp>

namespace akin {

Result<Template> parse(const std::string& text,
                       const std::string& filename,
                       const RenderOptions& opts) {
    auto tokens = lex(text, filename);
    AKIN_TRY(tokens);
    log::trace("%s: %zu tokens", filename.c_str(), tokens.value().size());
    return parse_tokens(tokens.value(), opts);
}

Result<std::string> expand_and_render(const Template& tpl,
                                      const RenderOptions& opts) {
    auto tokens = expand(tpl, opts);
    AKIN_TRY(tokens);
    return Result<std::string>::ok(serialize(tokens.value(), opts.spacing));
}

Result<std::string> render(const std::string& text,
                           const std::string& filename,
                           const RenderOptions& opts) {
    auto tpl = parse(text, filename, opts);
    AKIN_TRY(tpl);
    return expand_and_render(tpl.value(), opts);
}

} // namespace akin
