#include <gtest/gtest.h>
#include <addsub/addsub.hpp>

#include <string>
#include <thread>
#include <vector>

namespace {

using addsub::LexError;
using addsub::ParseError;
using addsub::TokKind;
using addsub::Token;
using addsub::TokenStream;

TEST(Pipeline, WellFormedInput) {
    auto o = addsub::run("10 + 3 + 7");
    ASSERT_TRUE(o.ok());
    EXPECT_EQ(std::get<std::int64_t>(o.result), 20);
    EXPECT_EQ(addsub::to_string(o.tokens), "[Number(10), Plus, Number(3), Plus, Number(7)]");
}

TEST(Pipeline, WhitespaceDoesNotChangeTheValue) {
    for (const char* in : {"10+3", "10 + 3", "10  +  3"}) {
        auto o = addsub::run(in);
        ASSERT_TRUE(o.ok()) << in;
        EXPECT_EQ(std::get<std::int64_t>(o.result), 13) << in;
    }
}

TEST(Pipeline, LexicalErrorStopsBeforeEvaluation) {
    auto o = addsub::run("10 + 3 + 7a + 8");
    ASSERT_FALSE(o.ok());
    ASSERT_TRUE(std::holds_alternative<LexError>(o.result));
    EXPECT_EQ(std::get<LexError>(o.result), (LexError{LexError::Kind::InvalidCharacter, U'a', 10}));
    EXPECT_TRUE(o.tokens.empty());
}

TEST(Pipeline, StructuralErrorsKeepTheirOwnType) {
    auto lead = addsub::run("+ 5");
    ASSERT_TRUE(std::holds_alternative<ParseError>(lead.result));
    EXPECT_EQ(std::get<ParseError>(lead.result),
              (ParseError{ParseError::Kind::InvalidToken, Token{TokKind::Plus}}));
    EXPECT_EQ(lead.tokens, (TokenStream{Token{TokKind::Plus}, Token{TokKind::Number, 5}}));

    auto trail = addsub::run("5 +");
    ASSERT_TRUE(std::holds_alternative<ParseError>(trail.result));
    EXPECT_EQ(std::get<ParseError>(trail.result), ParseError{ParseError::Kind::UnexpectedEndOfInput});

    auto empty = addsub::run("");
    ASSERT_TRUE(std::holds_alternative<ParseError>(empty.result));
    EXPECT_EQ(std::get<ParseError>(empty.result), ParseError{ParseError::Kind::UnexpectedEndOfInput});
}

TEST(Pipeline, IndependentRunsOnSeparateThreads) {
    std::vector<std::int64_t> got(8, -1);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < got.size(); ++i) {
        workers.emplace_back([i, &got] {
            std::string expr = std::to_string(i) + " + 100 - 1";
            auto o = addsub::run(expr);
            if (o.ok()) got[i] = std::get<std::int64_t>(o.result);
        });
    }
    for (auto& w : workers) w.join();
    for (std::size_t i = 0; i < got.size(); ++i) EXPECT_EQ(got[i], static_cast<std::int64_t>(i) + 99);
}

TEST(Describe, TokenText) {
    EXPECT_EQ(addsub::to_string(Token{TokKind::Number, 7}), "Number(7)");
    EXPECT_EQ(addsub::to_string(Token{TokKind::Plus}), "Plus");
    EXPECT_EQ(addsub::to_string(Token{TokKind::Subtract}), "Subtract");
    EXPECT_EQ(addsub::to_string(TokenStream{}), "[]");
}

TEST(Describe, LexErrors) {
    EXPECT_EQ(addsub::describe(LexError{LexError::Kind::InvalidCharacter, U'a', 10}),
              "Input contained an invalid character at 10: a");
    EXPECT_EQ(addsub::describe(LexError{LexError::Kind::InvalidCharacter, char32_t{0x00E9}, 4}),
              "Input contained an invalid character at 4: U+00E9");
    EXPECT_EQ(addsub::describe(LexError{LexError::Kind::InvalidCharacter, U'\t', 1}),
              "Input contained an invalid character at 1: U+0009");
    EXPECT_EQ(addsub::describe(LexError{LexError::Kind::NumberTooLarge, U'9', 0}),
              "Number literal at 0 does not fit in a 64-bit integer");
}

TEST(Describe, ParseErrors) {
    EXPECT_EQ(addsub::describe(ParseError{ParseError::Kind::UnexpectedEndOfInput}),
              "Unexpected end of input during parsing");
    EXPECT_EQ(addsub::describe(ParseError{ParseError::Kind::InvalidToken, Token{TokKind::Plus}}),
              "Invalid token during parsing: Plus");
    EXPECT_EQ(addsub::describe(ParseError{ParseError::Kind::InvalidToken, Token{TokKind::Number, 2}}),
              "Invalid token during parsing: Number(2)");
    EXPECT_EQ(addsub::describe(ParseError{ParseError::Kind::ArithmeticOverflow, Token{TokKind::Number, 2}}),
              "Arithmetic overflow while applying Number(2)");
}

} // namespace
