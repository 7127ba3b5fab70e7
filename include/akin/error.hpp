#pragma once

#include <string>

namespace akin {

struct AkinError {
    enum Code {
        Syntax,
        DuplicateDeclaration,
        UndeclaredVariable,
        TypeMismatch,
        LimitExceeded,
        IO,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int col = 0;
    int length = 0;  // span width in columns, 0 when unknown

    AkinError() = default;
    AkinError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    AkinError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    AkinError(Code c, std::string msg, std::string h,
              std::string f, int l, int cl = 0, int len = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), col(cl), length(len) {}

    std::string format() const;

    // Same as format(), plus the offending line of `source` with a caret
    // marker under the span.
    std::string format_with_source(const std::string& source) const;

    static const char* code_name(Code c);
};

} // namespace akin
