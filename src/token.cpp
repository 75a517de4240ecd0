#include "addsub/token.hpp"

namespace addsub {

std::string to_string(const Token& t) {
    switch (t.kind) {
        case TokKind::Number:   return "Number(" + std::to_string(t.number) + ")";
        case TokKind::Plus:     return "Plus";
        case TokKind::Subtract: return "Subtract";
    }
    return "?";
}

std::string to_string(const TokenStream& tokens) {
    std::string out = "[";
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i) out += ", ";
        out += to_string(tokens[i]);
    }
    out += "]";
    return out;
}

std::ostream& operator<<(std::ostream& os, const Token& t) {
    return os << to_string(t);
}

} // namespace addsub
