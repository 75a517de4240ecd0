#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace addsub {

enum class TokKind {
    Number,
    Plus,
    Subtract,
};

struct Token {
    TokKind kind{TokKind::Number};
    std::int64_t number{0}; // Number only
};

using TokenStream = std::vector<Token>;

inline bool operator==(const Token& a, const Token& b) {
    if (a.kind != b.kind) return false;
    return a.kind != TokKind::Number || a.number == b.number;
}
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

std::string to_string(const Token& t);

std::string to_string(const TokenStream& tokens);

std::ostream& operator<<(std::ostream& os, const Token& t);

} // namespace addsub
