#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "yconf/parser/tokenizer.hpp"

namespace yconf::parser::test {

using ::testing::ElementsAre;
using type::ScalarStyle;

class TokenizerTest : public ::testing::Test {
protected:
    static auto tokens(std::string_view input) -> std::vector<Token> {
        Tokenizer tokenizer(input);
        std::vector<Token> result;
        while (true) {
            auto token = tokenizer.next();
            const bool end = token.type == TokenType::StreamEnd;
            result.push_back(std::move(token));
            if (end) {
                return result;
            }
        }
    }

    static auto types(std::string_view input) -> std::vector<TokenType> {
        std::vector<TokenType> result;
        for (const auto& token : tokens(input)) {
            result.push_back(token.type);
        }
        return result;
    }

    static auto scalar(std::string_view input) -> Token {
        for (auto& token : tokens(input)) {
            if (token.type == TokenType::Scalar) {
                return token;
            }
        }
        return {};
    }

    // Value of the second scalar, the one after "key:".
    static auto value(std::string_view input) -> Token {
        int seen = 0;
        for (auto& token : tokens(input)) {
            if (token.type == TokenType::Scalar && ++seen == 2) {
                return token;
            }
        }
        return {};
    }
};

TEST_F(TokenizerTest, SimpleMapping) {
    EXPECT_THAT(types("a: 1\n"),
                ElementsAre(TokenType::Scalar, TokenType::MappingKey,
                            TokenType::Scalar, TokenType::NewLine,
                            TokenType::StreamEnd));
}

TEST_F(TokenizerTest, IndentationProducesIndentAndDedent) {
    const auto result = tokens("a:\n  b: 1\nc: 2\n");
    ASSERT_EQ(result.size(), 14U);
    EXPECT_EQ(result[3].type, TokenType::Indent);
    EXPECT_EQ(result[3].indent, 2U);
    EXPECT_EQ(result[8].type, TokenType::Dedent);
    EXPECT_EQ(result[8].indent, 0U);
    EXPECT_EQ(result[9].value, "c");
    EXPECT_EQ(result[9].mark, (Mark{3, 1}));
}

TEST_F(TokenizerTest, DashOpensLevelAtItsContent) {
    EXPECT_THAT(types("- a: 1\n  b: 2\n"),
                ElementsAre(TokenType::SequenceItem, TokenType::Indent,
                            TokenType::Scalar, TokenType::MappingKey,
                            TokenType::Scalar, TokenType::NewLine,
                            TokenType::Scalar, TokenType::MappingKey,
                            TokenType::Scalar, TokenType::NewLine,
                            TokenType::Dedent, TokenType::StreamEnd));
    EXPECT_EQ(tokens("- a: 1\n")[1].indent, 2U);
}

TEST_F(TokenizerTest, FlowCollections) {
    const auto result = tokens("[1, 'two', {a: b}]\n");
    EXPECT_THAT(types("[1, 'two', {a: b}]\n"),
                ElementsAre(TokenType::FlowSequenceStart, TokenType::Scalar,
                            TokenType::Comma, TokenType::Scalar,
                            TokenType::Comma, TokenType::FlowMappingStart,
                            TokenType::Scalar, TokenType::MappingKey,
                            TokenType::Scalar, TokenType::FlowMappingEnd,
                            TokenType::FlowSequenceEnd, TokenType::NewLine,
                            TokenType::StreamEnd));
    EXPECT_EQ(result[3].value, "two");
    EXPECT_EQ(result[3].style, ScalarStyle::SingleQuoted);
}

TEST_F(TokenizerTest, TabIndentationIsALexError) {
    EXPECT_THROW(tokens("a:\n\tb: 1\n"), error::LexError);
}

TEST_F(TokenizerTest, LexErrorCarriesPosition) {
    try {
        tokens("a: 1\nb: \"open\n");
        FAIL() << "expected a LexError";
    } catch (const error::LexError& e) {
        EXPECT_EQ(e.code(), error::ErrorCode::Lex);
        ASSERT_TRUE(e.mark().has_value());
        EXPECT_EQ(e.mark()->line, 2U);
    }
}

TEST_F(TokenizerTest, CommentsAreTokens) {
    const auto result = tokens("# header\na: 1 # trailing\n");
    EXPECT_EQ(result[0].type, TokenType::Comment);
    EXPECT_EQ(result[0].value, "header");
    EXPECT_EQ(result[3].value, "1");
    EXPECT_EQ(result[4].type, TokenType::Comment);
    EXPECT_EQ(result[4].value, "trailing");
}

TEST_F(TokenizerTest, HashInsideWordIsNotAComment) {
    EXPECT_EQ(value("a: b#c\n").value, "b#c");
}

TEST_F(TokenizerTest, SingleQuotedEscapesQuote) {
    EXPECT_EQ(value("a: 'it''s'\n").value, "it's");
}

TEST_F(TokenizerTest, DoubleQuotedEscapes) {
    EXPECT_EQ(value(R"(a: "t\tb\x41\\\"")").value, "t\tbA\\\"");
    EXPECT_EQ(value(R"(a: "\u00e9")").value, "\xC3\xA9");
    EXPECT_EQ(value(R"(a: "\uD83D\uDE00")").value, "\xF0\x9F\x98\x80");
    EXPECT_EQ(value(R"(a: "\U0001F600")").value, "\xF0\x9F\x98\x80");
    EXPECT_EQ(value(R"(a: "a\_b")").value, "a\xC2\xA0" "b");
}

TEST_F(TokenizerTest, InvalidEscapeIsALexError) {
    EXPECT_THROW(tokens(R"(a: "\q")"), error::LexError);
    EXPECT_THROW(tokens(R"(a: "\xZZ")"), error::LexError);
}

TEST_F(TokenizerTest, QuotedScalarsFoldLineBreaks) {
    EXPECT_EQ(value("a: \"one\n  two\n\n  three\"\n").value, "one two\nthree");
    EXPECT_EQ(value("a: \"one\\\n  two\"\n").value, "onetwo");
}

TEST_F(TokenizerTest, PlainScalarsFoldAcrossLines) {
    EXPECT_EQ(value("a: one\n  two\n\n  three\nb: 1\n").value,
              "one two\nthree");
    EXPECT_EQ(value("a: [one\n  two, x]\n").value, "one two");
}

TEST_F(TokenizerTest, LiteralBlockScalar) {
    const auto token = value("a: |\n  line1\n   line2\nb: 1\n");
    EXPECT_EQ(token.style, ScalarStyle::Literal);
    EXPECT_EQ(token.value, "line1\n line2\n");
}

TEST_F(TokenizerTest, FoldedBlockScalar) {
    const auto token = value("a: >\n  one\n  two\n\n  three\n");
    EXPECT_EQ(token.style, ScalarStyle::Folded);
    EXPECT_EQ(token.value, "one two\nthree\n");
}

TEST_F(TokenizerTest, BlockScalarChomping) {
    EXPECT_EQ(value("a: |-\n  x\n\nb: 1\n").value, "x");
    EXPECT_EQ(value("a: |\n  x\n\nb: 1\n").value, "x\n");
    EXPECT_EQ(value("a: |+\n  x\n\nb: 1\n").value, "x\n\n");
}

TEST_F(TokenizerTest, BlockScalarIndentationIndicator) {
    EXPECT_EQ(value("a: |2\n    indented\n  plain\n").value,
              "  indented\nplain\n");
}

TEST_F(TokenizerTest, MalformedBlockScalarHeader) {
    EXPECT_THROW(tokens("a: |x\n  y\n"), error::LexError);
}

TEST_F(TokenizerTest, AnchorsAliasesAndTags) {
    const auto result = tokens("a: &base !!str x\nb: *base\n");
    EXPECT_EQ(result[2].type, TokenType::Anchor);
    EXPECT_EQ(result[2].value, "base");
    EXPECT_EQ(result[3].type, TokenType::Tag);
    EXPECT_EQ(result[3].value, "!!str");
    EXPECT_EQ(result[8].type, TokenType::Alias);
    EXPECT_EQ(result[8].value, "base");
}

TEST_F(TokenizerTest, MergeKey) {
    EXPECT_THAT(types("<<: *a\n"),
                ElementsAre(TokenType::MergeKey, TokenType::MappingKey,
                            TokenType::Alias, TokenType::NewLine,
                            TokenType::StreamEnd));
    EXPECT_EQ(scalar("\"<<\": 1\n").value, "<<");
}

TEST_F(TokenizerTest, DocumentMarkersAndDirectives) {
    EXPECT_THAT(types("%YAML 1.2\n---\na: 1\n...\n"),
                ElementsAre(TokenType::DocumentStart, TokenType::NewLine,
                            TokenType::Scalar, TokenType::MappingKey,
                            TokenType::Scalar, TokenType::NewLine,
                            TokenType::DocumentEnd, TokenType::NewLine,
                            TokenType::StreamEnd));
}

TEST_F(TokenizerTest, StrayFlowIndicatorInBlockContext) {
    EXPECT_THROW(tokens("a: ]\n"), error::LexError);
}

TEST_F(TokenizerTest, ResetRestartsTheStream) {
    Tokenizer tokenizer("a: 1\n");
    EXPECT_EQ(tokenizer.next().value, "a");
    EXPECT_EQ(tokenizer.peek().type, TokenType::MappingKey);
    tokenizer.reset();
    EXPECT_EQ(tokenizer.next().value, "a");
}

TEST_F(TokenizerTest, StreamEndRepeats) {
    Tokenizer tokenizer("");
    EXPECT_EQ(tokenizer.next().type, TokenType::StreamEnd);
    EXPECT_EQ(tokenizer.next().type, TokenType::StreamEnd);
}

}  // namespace yconf::parser::test
