#include "addsub/lexer.hpp"
#include <limits>
#include <stdexcept>

namespace addsub {

static constexpr char32_t kReplacement = 0xFFFD;

static bool is_cont(unsigned char b) { return (b & 0xC0) == 0x80; }

static bool is_digit(char32_t c) { return c >= U'0' && c <= U'9'; }

// Decode the code point starting at byte `i`. `len` receives its width.
static char32_t decode_utf8(std::string_view s, std::size_t i, std::size_t& len) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    len = 1;
    if (b0 < 0x80) return b0;

    std::size_t need = 0;
    char32_t cp = 0;
    unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1; cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        need = 2; cp = b0 & 0x0F;
        if (b0 == 0xE0) lo = 0xA0; // overlong
        if (b0 == 0xED) hi = 0x9F; // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        need = 3; cp = b0 & 0x07;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return kReplacement;
    }

    if (i + need >= s.size()) return kReplacement; // truncated
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if (b1 < lo || b1 > hi) return kReplacement;
    cp = (cp << 6) | (b1 & 0x3F);
    for (std::size_t k = 2; k <= need; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if (!is_cont(b)) return kReplacement;
        cp = (cp << 6) | (b & 0x3F);
    }
    len = need + 1;
    return cp;
}

std::optional<char32_t> Scanner::peek() const {
    if (is_end()) return std::nullopt;
    std::size_t len = 0;
    return decode_utf8(s_, i_, len);
}

void Scanner::advance() {
    if (is_end()) throw std::logic_error("Scanner::advance() called at end of input");
    std::size_t len = 0;
    decode_utf8(s_, i_, len);
    i_ += len;
    ++pos_;
}

Result<std::int64_t, LexError> Scanner::scan_number() {
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    const std::size_t start = pos_;
    const char32_t first = *peek();

    std::int64_t value = 0;
    while (auto c = peek()) {
        if (!is_digit(*c)) break;
        const std::int64_t digit = static_cast<std::int64_t>(*c - U'0');
        if (value > (kMax - digit) / 10) {
            return LexError{LexError::Kind::NumberTooLarge, first, start};
        }
        value = value * 10 + digit;
        advance();
    }
    return value;
}

ScanResult Scanner::scan() {
    TokenStream tokens;
    while (auto c = peek()) {
        if (is_digit(*c)) {
            auto n = scan_number();
            if (!n) return n.error();
            tokens.push_back(Token{TokKind::Number, n.value()});
            continue;
        }
        switch (*c) {
            case U'+': tokens.push_back(Token{TokKind::Plus}); advance(); break;
            case U'-': tokens.push_back(Token{TokKind::Subtract}); advance(); break;
            case U' ': advance(); break;
            default:
                return LexError{LexError::Kind::InvalidCharacter, *c, pos_};
        }
    }
    return tokens;
}

ScanResult scan(std::string_view input) {
    Scanner scanner(input);
    return scanner.scan();
}

} // namespace addsub
