#include "addsub/addsub.hpp"
#include <iomanip>
#include <sstream>

namespace addsub {

Outcome run(std::string_view input) {
    Outcome out;
    ScanResult scanned = scan(input);
    if (!scanned) {
        out.result = scanned.error();
        return out;
    }
    out.tokens = std::move(scanned).value();

    EvalResult v = evaluate_tokens(out.tokens);
    if (v) out.result = v.value();
    else   out.result = v.error();
    return out;
}

std::string describe_char(char32_t c) {
    if (c >= 0x20 && c < 0x7F) return std::string(1, static_cast<char>(c));
    std::ostringstream os;
    os << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
       << static_cast<std::uint32_t>(c);
    return os.str();
}

std::string describe(const LexError& e) {
    switch (e.kind) {
        case LexError::Kind::InvalidCharacter:
            return "Input contained an invalid character at " + std::to_string(e.position) + ": " +
                   describe_char(e.character);
        case LexError::Kind::NumberTooLarge:
            return "Number literal at " + std::to_string(e.position) +
                   " does not fit in a 64-bit integer";
    }
    return "Unknown lexical error";
}

std::string describe(const ParseError& e) {
    const std::string tok = e.token ? to_string(*e.token) : std::string("<none>");
    switch (e.kind) {
        case ParseError::Kind::UnexpectedEndOfInput:
            return "Unexpected end of input during parsing";
        case ParseError::Kind::InvalidToken:
            return "Invalid token during parsing: " + tok;
        case ParseError::Kind::ArithmeticOverflow:
            return "Arithmetic overflow while applying " + tok;
    }
    return "Unknown parse error";
}

} // namespace addsub
