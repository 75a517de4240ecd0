#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include "addsub/result.hpp"
#include "addsub/token.hpp"

namespace addsub {

struct ParseError {
    enum class Kind {
        UnexpectedEndOfInput, // a number was required but tokens ran out
        InvalidToken,         // operator where a number belongs, or two numbers in a row
        ArithmeticOverflow,   // running result left the int64_t range
    };

    Kind kind{Kind::UnexpectedEndOfInput};
    std::optional<Token> token{}; // empty for UnexpectedEndOfInput
};

inline bool operator==(const ParseError& a, const ParseError& b) {
    return a.kind == b.kind && a.token == b.token;
}
inline bool operator!=(const ParseError& a, const ParseError& b) { return !(a == b); }

using EvalResult = Result<std::int64_t, ParseError>;

// Grammar: Number ((Plus | Subtract) Number)*, folded left to right.
class Evaluator {
public:
    explicit Evaluator(const TokenStream& tokens) : tokens_(tokens) {}
    Evaluator(TokenStream&&) = delete; // tokens_ is a reference

    EvalResult evaluate();

    std::optional<Token> next_token();
    EvalResult expect_number();

    std::size_t position() const { return i_; }

private:
    const TokenStream& tokens_;
    std::size_t i_{0};
};

EvalResult evaluate_tokens(const TokenStream& tokens);

} // namespace addsub
