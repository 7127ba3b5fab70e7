#include <akin/error.hpp>
#include <algorithm>

namespace akin {

const char* AkinError::code_name(Code c) {
    switch (c) {
        case Syntax:               return "Syntax";
        case DuplicateDeclaration: return "DuplicateDeclaration";
        case UndeclaredVariable:   return "UndeclaredVariable";
        case TypeMismatch:         return "TypeMismatch";
        case LimitExceeded:        return "LimitExceeded";
        case IO:                   return "IO";
        case Config:               return "Config";
        case InvalidArg:           return "InvalidArg";
    }
    return "Unknown";
}

std::string AkinError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (col > 0) {
                result += ":";
                result += std::to_string(col);
            }
        }
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

// Returns the 1-based line `n` of `source` without its terminator, or
// an empty string when the line does not exist.
static std::string source_line(const std::string& source, int n) {
    size_t start = 0;
    for (int i = 1; i < n; ++i) {
        size_t nl = source.find('\n', start);
        if (nl == std::string::npos) return "";
        start = nl + 1;
    }
    size_t end = source.find('\n', start);
    if (end == std::string::npos) end = source.size();
    std::string text = source.substr(start, end - start);
    if (!text.empty() && text.back() == '\r') text.pop_back();
    return text;
}

std::string AkinError::format_with_source(const std::string& source) const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (line > 0) {
        result += "\n  --> ";
        result += file.empty() ? "<input>" : file;
        result += ":" + std::to_string(line);
        if (col > 0) result += ":" + std::to_string(col);

        std::string text = source_line(source, line);
        if (!text.empty()) {
            std::string gutter = std::to_string(line);
            std::string pad(gutter.size(), ' ');
            result += "\n " + pad + " |";
            result += "\n " + gutter + " | " + text;
            if (col > 0) {
                // Keep tabs so the caret lines up under the source text
                std::string marker;
                for (int i = 1; i < col && i - 1 < static_cast<int>(text.size()); ++i) {
                    marker += (text[i - 1] == '\t') ? '\t' : ' ';
                }
                int width = std::max(1, length);
                marker += '^';
                marker.append(static_cast<size_t>(width - 1), '~');
                result += "\n " + pad + " | " + marker;
            }
        }
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace akin
