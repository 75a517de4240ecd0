#include "addsub/parser.hpp"
#include <limits>

namespace addsub {

using Limits = std::numeric_limits<std::int64_t>;

static bool add_overflows(std::int64_t a, std::int64_t b) {
    return (b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b);
}

static bool sub_overflows(std::int64_t a, std::int64_t b) {
    return (b > 0 && a < Limits::min() + b) || (b < 0 && a > Limits::max() + b);
}

std::optional<Token> Evaluator::next_token() {
    if (i_ >= tokens_.size()) return std::nullopt;
    return tokens_[i_++];
}

EvalResult Evaluator::expect_number() {
    auto t = next_token();
    if (!t) return ParseError{ParseError::Kind::UnexpectedEndOfInput};
    switch (t->kind) {
        case TokKind::Number:
            return t->number;
        case TokKind::Plus:
        case TokKind::Subtract:
            return ParseError{ParseError::Kind::InvalidToken, t};
    }
    return ParseError{ParseError::Kind::InvalidToken, t};
}

EvalResult Evaluator::evaluate() {
    auto first = expect_number();
    if (!first) return first;
    std::int64_t acc = first.value();

    while (auto t = next_token()) {
        switch (t->kind) {
            case TokKind::Plus:
            case TokKind::Subtract: {
                const std::size_t operand_at = i_;
                auto rhs = expect_number();
                if (!rhs) return rhs;
                const std::int64_t b = rhs.value();
                const bool plus = t->kind == TokKind::Plus;
                if (plus ? add_overflows(acc, b) : sub_overflows(acc, b)) {
                    return ParseError{ParseError::Kind::ArithmeticOverflow, tokens_[operand_at]};
                }
                acc = plus ? acc + b : acc - b;
            } break;

            case TokKind::Number:
                return ParseError{ParseError::Kind::InvalidToken, t};
        }
    }
    return acc;
}

EvalResult evaluate_tokens(const TokenStream& tokens) {
    Evaluator ev(tokens);
    return ev.evaluate();
}

} // namespace addsub
