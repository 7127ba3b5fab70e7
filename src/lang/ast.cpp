#include <akin/lang/ast.hpp>

namespace akin {

Status VariableTable::declare(Variable var) {
    auto it = vars_.find(var.name);
    if (it != vars_.end()) {
        const auto& first = it->second.pos;
        return AkinError{AkinError::DuplicateDeclaration,
            "variable '" + var.name + "' is already declared",
            "first declared at line " + std::to_string(first.line) +
                ", column " + std::to_string(first.col),
            var.pos.file, var.pos.line, var.pos.col,
            static_cast<int>(var.name.size())};
    }
    order_.push_back(var.name);
    std::string key = var.name;
    vars_.emplace(std::move(key), std::move(var));
    return ok_status();
}

const Variable* VariableTable::find(const std::string& name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

} // namespace akin
