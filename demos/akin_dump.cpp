// akin_dump.cpp
//
// Prints what the engine sees in a template: the token stream, the
// variable table and the block tree with each block's direct references
// and factor.
//
//     ./akin-dump template.akin             # variables + block tree
//     ./akin-dump template.akin --tokens    # token stream only
//     ./akin-dump template.akin --tokens --vars --tree

#include <akin/lang/expander.hpp>
#include <akin/lang/lexer.hpp>
#include <akin/lang/parser.hpp>
#include <akin/lang/serializer.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>

using namespace akin;

static std::string value_str(const Value& v) {
    if (v.empty()) return "NONE";
    return serialize(v);
}

static void dump_block(const Template& tpl, BlockId id, int depth) {
    const Block& block = tpl.blocks[id];
    std::string indent(depth * 2, ' ');

    auto refs = direct_refs(block);
    auto factor = block_factor(block, tpl.vars);
    std::cout << indent << "block #" << id << "  nodes=" << block.nodes.size()
              << "  factor=" << (factor.is_ok() ? std::to_string(factor.value()) : "?");
    if (!refs.empty()) {
        std::cout << "  refs:";
        for (auto& r : refs) std::cout << " *" << r;
    }
    std::cout << "\n";

    for (auto& node : block.nodes) {
        if (auto* child = std::get_if<ChildBlock>(&node)) {
            std::cout << indent << "  " << child->open.text << " at "
                      << child->open.pos.line << ":" << child->open.pos.col << "\n";
            dump_block(tpl, child->block, depth + 2);
            std::cout << indent << "  " << child->close.text << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: akin-dump <file> [--tokens] [--vars] [--tree]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_tokens = false;
    bool show_vars = false;
    bool show_tree = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") show_tokens = true;
        else if (arg == "--vars") show_vars = true;
        else if (arg == "--tree") show_tree = true;
        else {
            std::cerr << "error: unknown option " << arg << "\n";
            return 1;
        }
    }
    if (!show_tokens && !show_vars && !show_tree) {
        show_vars = true;
        show_tree = true;
    }

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    std::string source = ss.str();

    // Lex
    auto lr = lex(source, path);
    if (lr.is_err()) {
        std::cerr << lr.error().format_with_source(source) << "\n";
        return 1;
    }

    auto& tokens = lr.value();
    std::cout << "--- " << path << " ---\n";
    std::cout << "Tokens: " << tokens.size() << "\n";

    if (show_tokens) {
        std::cout << "\n-- Tokens --\n";
        for (auto& t : tokens) {
            std::cout << "  " << t.pos.line << ":" << t.pos.col
                      << "  " << token_kind_name(t.kind)
                      << "  \"" << t.text << "\"";
            if (t.joint) std::cout << "  [joint]";
            if (!t.spaced) std::cout << "  [adjacent]";
            std::cout << "\n";
        }
    }

    // Parse
    auto pr = parse_tokens(tokens);
    if (pr.is_err()) {
        std::cerr << pr.error().format_with_source(source) << "\n";
        return 1;
    }

    auto& tpl = pr.value();
    if (show_vars) {
        std::cout << "\n-- Variables (" << tpl.vars.size() << ") --\n";
        for (auto& name : tpl.vars.names()) {
            const Variable* var = tpl.vars.find(name);
            std::cout << "  " << name << "  (line " << var->pos.line << ", "
                      << var->values.size() << " values)\n";
            for (size_t i = 0; i < var->values.size(); ++i) {
                std::cout << "    [" << i << "] " << value_str(var->values[i]) << "\n";
            }
        }
    }

    if (show_tree) {
        std::cout << "\n-- Blocks (" << tpl.blocks.size() << ") --\n";
        dump_block(tpl, tpl.root, 1);
    }

    return 0;
}
