#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include "addsub/lexer.hpp"
#include "addsub/parser.hpp"
#include "addsub/token.hpp"

namespace addsub {

struct Outcome {
    TokenStream tokens; // empty when scanning failed
    std::variant<std::int64_t, LexError, ParseError> result;

    bool ok() const noexcept { return std::holds_alternative<std::int64_t>(result); }
};

Outcome run(std::string_view input);

std::string describe(const LexError& e);
std::string describe(const ParseError& e);

std::string describe_char(char32_t c);

} // namespace addsub
