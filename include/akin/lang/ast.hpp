#pragma once

#include <akin/lang/token.hpp>
#include <akin/result.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace akin {

// ---------------------------------------------------------------------------
// Variables
// ---------------------------------------------------------------------------

// One substitution option. An empty sequence is the NONE value.
using Value = TokenSeq;

struct Variable {
    std::string name;
    std::vector<Value> values;  // never empty
    SourcePos pos;              // position of the name in its `let`
};

// Name -> Variable, remembering declaration order. Filled by the
// declaration parser and read-only afterwards.
class VariableTable {
public:
    // Fails with DuplicateDeclaration when the name is already declared
    Status declare(Variable var);

    const Variable* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    // Names in declaration order
    const std::vector<std::string>& names() const { return order_; }

private:
    std::unordered_map<std::string, Variable> vars_;
    std::vector<std::string> order_;
};

// ---------------------------------------------------------------------------
// Block tree
// ---------------------------------------------------------------------------

// Index into Template::blocks
using BlockId = std::uint32_t;

// `*name` in the body
struct VariableRef {
    std::string name;
    SourcePos pos;
    bool joint = false;   // flags of the `*` marker, handed to the first
    bool spaced = false;  // substituted token
};

// A matched delimiter pair; its content is a Block of its own
struct ChildBlock {
    Token open;
    Token close;
    BlockId block = 0;
};

// A string literal whose text mentions declared variables as `*name`
struct StringRef {
    Token token;
    std::vector<std::string> names;  // distinct, first-use order
};

using Node = std::variant<Token, VariableRef, ChildBlock, StringRef>;

struct Block {
    std::vector<Node> nodes;
};

// Everything one invocation needs: built by parse(), read by expand().
struct Template {
    VariableTable vars;
    std::vector<Block> blocks;
    BlockId root = 0;
};

} // namespace akin
