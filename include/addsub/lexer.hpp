#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include "addsub/result.hpp"
#include "addsub/token.hpp"

namespace addsub {

struct LexError {
    enum class Kind {
        InvalidCharacter, // not a digit, '+', '-' or ' '
        NumberTooLarge,   // literal does not fit in int64_t
    };

    Kind kind{Kind::InvalidCharacter};
    char32_t character{0};   // offending code point (first digit for NumberTooLarge)
    std::size_t position{0}; // code point index of `character`
};

inline bool operator==(const LexError& a, const LexError& b) {
    return a.kind == b.kind && a.character == b.character && a.position == b.position;
}
inline bool operator!=(const LexError& a, const LexError& b) { return !(a == b); }

using ScanResult = Result<TokenStream, LexError>;

// Positions are code point indices into UTF-8 text.
class Scanner {
public:
    explicit Scanner(std::string_view s) : s_(s) {}

    ScanResult scan();

    std::optional<char32_t> peek() const; // malformed UTF-8 reads as U+FFFD
    void advance();                       // throws std::logic_error at end

    std::size_t position() const { return pos_; }
    bool is_end() const { return i_ >= s_.size(); }

private:
    Result<std::int64_t, LexError> scan_number();

    std::string_view s_;
    std::size_t i_{0};   // byte offset
    std::size_t pos_{0}; // code point index
};

ScanResult scan(std::string_view input);

} // namespace addsub
