#include <akin/lang/expander.hpp>
#include <akin/lang/serializer.hpp>
#include <akin/log.hpp>
#include <algorithm>
#include <cctype>

namespace akin {

namespace {

template <class... Ts> struct Overload : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overload(Ts...) -> Overload<Ts...>;

bool is_word_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

AkinError undeclared(const std::string& name, const SourcePos& pos) {
    return AkinError{AkinError::UndeclaredVariable,
        "use of undeclared variable '" + name + "'",
        "declare it first with `let &" + name + " = [...];`",
        pos.file, pos.line, pos.col, static_cast<int>(name.size()) + 1};
}

// r"...", br#"..."#: backslashes and quotes cannot be escaped inside
bool is_raw_string(const std::string& text) {
    for (char c : text) {
        if (c == 'r') return true;
        if (c == '"' || c == '#') return false;
    }
    return false;
}

std::string escape_quoted(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// Value `i` of `var`; past the end the last value is reused
const Value& pick(const Variable& var, std::size_t i) {
    return var.values[std::min(i, var.values.size() - 1)];
}

void add_unique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

struct Expander {
    const VariableTable& vars;
    const std::vector<Block>& arena;
    const RenderOptions& opts;

    Expander(const VariableTable& v, const std::vector<Block>& a,
             const RenderOptions& o)
        : vars(v), arena(a), opts(o) {}

    Result<std::vector<TokenSeq>> expand(BlockId id) {
        if (id >= arena.size()) {
            return AkinError{AkinError::InvalidArg,
                "block index " + std::to_string(id) + " out of range"};
        }
        const Block& block = arena[id];

        auto factor_r = block_factor(block, vars);
        AKIN_TRY(factor_r);
        std::size_t factor = factor_r.value();

        // Each child expands once; its copies go into every parent copy
        std::vector<std::vector<TokenSeq>> child_copies(block.nodes.size());
        for (size_t n = 0; n < block.nodes.size(); ++n) {
            if (const auto* child = std::get_if<ChildBlock>(&block.nodes[n])) {
                auto r = expand(child->block);
                AKIN_TRY(r);
                child_copies[n] = std::move(r).value();
            }
        }

        if (log::enabled(log::Trace)) {
            log::trace("block %u: %zu nodes, %zu direct refs, factor %zu",
                       static_cast<unsigned>(id), block.nodes.size(),
                       direct_refs(block).size(), factor);
        }

        // Each copy appears in the final output at least once
        std::size_t produced = 0;
        std::vector<TokenSeq> copies;
        copies.reserve(factor);
        for (std::size_t i = 0; i < factor; ++i) {
            TokenSeq out;
            for (size_t n = 0; n < block.nodes.size(); ++n) {
                Status st = std::visit(Overload{
                    [&](const Token& tok) -> Status {
                        out.push_back(tok);
                        return ok_status();
                    },
                    [&](const VariableRef& ref) -> Status {
                        const Variable* var = vars.find(ref.name);
                        if (!var) return undeclared(ref.name, ref.pos);
                        const Value& value = pick(*var, i);
                        size_t start = out.size();
                        out.insert(out.end(), value.begin(), value.end());
                        if (out.size() > start) {
                            out[start].joint = ref.joint;
                            out[start].spaced = ref.spaced;
                        }
                        return ok_status();
                    },
                    [&](const ChildBlock& child) -> Status {
                        out.push_back(child.open);
                        append_copies(out, child_copies[n]);
                        out.push_back(child.close);
                        return ok_status();
                    },
                    [&](const StringRef& str) -> Status {
                        Token tok = str.token;
                        auto text = interpolate(str.token, i);
                        AKIN_TRY(text);
                        tok.text = std::move(text).value();
                        out.push_back(std::move(tok));
                        return ok_status();
                    },
                }, block.nodes[n]);
                AKIN_TRY(st);
            }

            produced += out.size();
            if (produced > opts.max_output_tokens) {
                const SourcePos* at = first_pos(block);
                AkinError err{AkinError::LimitExceeded,
                    "expansion produces more than " +
                        std::to_string(opts.max_output_tokens) + " tokens",
                    "raise render.max-output-tokens or split the template"};
                if (at) {
                    err.file = at->file;
                    err.line = at->line;
                    err.col = at->col;
                }
                return err;
            }
            copies.push_back(std::move(out));
        }

        return Result<std::vector<TokenSeq>>::ok(std::move(copies));
    }

    // Substitute `*name` in the text of string literal `lit`. Inserted
    // text is escaped; a raw literal cannot escape, so a value containing
    // its terminator is rejected.
    Result<std::string> interpolate(const Token& lit, std::size_t i) const {
        const std::string& text = lit.text;
        bool raw = is_raw_string(text);
        // `"` followed by as many '#' as precede the opening quote
        std::string terminator = "\"";
        if (raw) {
            size_t quote = text.find('"');
            size_t hashes = 0;
            while (hashes < quote && text[quote - 1 - hashes] == '#') ++hashes;
            terminator.append(hashes, '#');
        }

        std::string out;
        out.reserve(text.size());
        size_t p = 0;
        while (p < text.size()) {
            char c = text[p];
            if (c == '*' && p + 1 < text.size() && is_word_start(text[p + 1])) {
                size_t end = p + 1;
                while (end < text.size() && is_word_char(text[end])) ++end;
                std::string name = text.substr(p + 1, end - p - 1);
                if (const Variable* var = vars.find(name)) {
                    std::string value = serialize(pick(*var, i), opts.spacing);
                    if (!raw) {
                        out += escape_quoted(value);
                    } else if (value.find(terminator) != std::string::npos) {
                        return AkinError{AkinError::TypeMismatch,
                            "value '" + value + "' of '" + name +
                                "' would end the raw string early",
                            "use a plain string literal, which escapes inserted quotes",
                            lit.pos.file, lit.pos.line, lit.pos.col,
                            static_cast<int>(text.size())};
                    } else {
                        out += value;
                    }
                } else {
                    out.append(text, p, end - p);
                }
                p = end;
                continue;
            }
            out += c;
            ++p;
        }
        return Result<std::string>::ok(std::move(out));
    }

    // Position of the first node of `block` that has one, for diagnostics
    static const SourcePos* first_pos(const Block& block) {
        for (const auto& node : block.nodes) {
            if (const auto* tok = std::get_if<Token>(&node)) return &tok->pos;
            if (const auto* ref = std::get_if<VariableRef>(&node)) return &ref->pos;
            if (const auto* child = std::get_if<ChildBlock>(&node)) return &child->open.pos;
            if (const auto* str = std::get_if<StringRef>(&node)) return &str->token.pos;
        }
        return nullptr;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Scope resolution
// ---------------------------------------------------------------------------

std::vector<std::string> direct_refs(const Block& block) {
    std::vector<std::string> names;
    for (const auto& node : block.nodes) {
        if (const auto* ref = std::get_if<VariableRef>(&node)) {
            add_unique(names, ref->name);
        } else if (const auto* str = std::get_if<StringRef>(&node)) {
            for (const auto& name : str->names) add_unique(names, name);
        }
    }
    return names;
}

Result<std::size_t> block_factor(const Block& block, const VariableTable& vars) {
    std::size_t factor = 1;
    for (const auto& node : block.nodes) {
        if (const auto* ref = std::get_if<VariableRef>(&node)) {
            const Variable* var = vars.find(ref->name);
            if (!var) return undeclared(ref->name, ref->pos);
            factor = std::max(factor, var->values.size());
        } else if (const auto* str = std::get_if<StringRef>(&node)) {
            for (const auto& name : str->names) {
                const Variable* var = vars.find(name);
                if (!var) return undeclared(name, str->token.pos);
                factor = std::max(factor, var->values.size());
            }
        }
    }
    return Result<std::size_t>::ok(factor);
}

std::vector<std::string> interpolation_names(const std::string& text,
                                             const VariableTable& vars) {
    std::vector<std::string> names;
    size_t p = 0;
    while (p < text.size()) {
        if (text[p] == '*' && p + 1 < text.size() && is_word_start(text[p + 1])) {
            size_t end = p + 1;
            while (end < text.size() && is_word_char(text[end])) ++end;
            std::string name = text.substr(p + 1, end - p - 1);
            if (vars.contains(name)) add_unique(names, name);
            p = end;
            continue;
        }
        ++p;
    }
    return names;
}

// ---------------------------------------------------------------------------
// Expansion
// ---------------------------------------------------------------------------

void append_copies(TokenSeq& out, const std::vector<TokenSeq>& copies) {
    bool emitted = false;
    for (const auto& copy : copies) {
        size_t start = out.size();
        out.insert(out.end(), copy.begin(), copy.end());
        if (out.size() == start) continue;
        if (emitted && !out[start].joint) out[start].spaced = true;
        emitted = true;
    }
}

Result<std::vector<TokenSeq>> expand_block(const VariableTable& vars,
                                           const std::vector<Block>& arena,
                                           BlockId id,
                                           const RenderOptions& opts) {
    Expander expander(vars, arena, opts);
    return expander.expand(id);
}

Result<std::vector<TokenSeq>> expand_block(const Template& tpl, BlockId id,
                                           const RenderOptions& opts) {
    return expand_block(tpl.vars, tpl.blocks, id, opts);
}

Result<TokenSeq> expand(const Template& tpl, const RenderOptions& opts) {
    auto copies = expand_block(tpl, tpl.root, opts);
    AKIN_TRY(copies);

    TokenSeq out;
    append_copies(out, copies.value());
    log::debug("expanded %zu root copies into %zu tokens",
               copies.value().size(), out.size());
    return Result<TokenSeq>::ok(std::move(out));
}

} // namespace akin
