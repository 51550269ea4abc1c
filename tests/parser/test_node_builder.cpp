#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "yconf/parser/node_builder.hpp"

namespace yconf::parser::test {

using type::ScalarKind;

class NodeBuilderTest : public ::testing::Test {
protected:
    // Follows mapping keys, or item indices through sequences.
    static auto at(const Document& document,
                   const std::vector<std::string>& path) -> NodeRef {
        NodeRef ref = document.root.value();
        for (const auto& segment : path) {
            if (document.arena.node(ref.id).is_sequence()) {
                ref = document.arena.sequence(ref.id).items.at(
                    std::stoul(segment));
                continue;
            }
            const auto* found = document.arena.mapping(ref.id).find(segment);
            if (found == nullptr) {
                throw std::out_of_range(segment);
            }
            ref = *found;
        }
        return ref;
    }

    static auto scalar(const Document& document,
                       const std::vector<std::string>& path)
        -> const type::Scalar& {
        return document.arena.scalar(at(document, path).id);
    }

    static auto keys(const Document& document,
                     const std::vector<std::string>& path)
        -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& [key, ref] :
             document.arena.mapping(at(document, path).id).entries) {
            result.push_back(key);
        }
        return result;
    }

    static auto items(const Document& document,
                      const std::vector<std::string>& path) -> std::size_t {
        return document.arena.sequence(at(document, path).id).items.size();
    }

    static auto parse_error_code(std::string_view input) -> error::ErrorCode {
        try {
            (void)parse_document(input);
        } catch (const error::YamlError& e) {
            return e.code();
        }
        ADD_FAILURE() << "no error for: " << input;
        return error::ErrorCode::Parse;
    }
};

TEST_F(NodeBuilderTest, EmptyDocumentHasNoRoot) {
    EXPECT_FALSE(parse_document("").root.has_value());
    EXPECT_FALSE(parse_document("# only a comment\n\n").root.has_value());

    const auto framed = parse_document("---\n...\n");
    ASSERT_TRUE(framed.root.has_value());
    EXPECT_TRUE(framed.arena.scalar(framed.root->id).is_null());
}

TEST_F(NodeBuilderTest, NestedBlockMapping) {
    const auto doc = parse_document(
        "solver:\n"
        "  tolerance: 1e-6\n"
        "  limits:\n"
        "    iterations: 100\n"
        "name: run\n");
    EXPECT_THAT(keys(doc, {}), ::testing::ElementsAre("solver", "name"));
    EXPECT_THAT(keys(doc, {"solver"}),
                ::testing::ElementsAre("tolerance", "limits"));
    EXPECT_EQ(scalar(doc, {"solver", "tolerance"}).kind(), ScalarKind::Real);
    EXPECT_EQ(scalar(doc, {"solver", "limits", "iterations"}).as<int>(), 100);
    EXPECT_EQ(scalar(doc, {"name"}).text(), "run");
}

TEST_F(NodeBuilderTest, BlockSequences) {
    const auto doc = parse_document(
        "plain:\n"
        "  - 1\n"
        "  - 2\n"
        "same_column:\n"
        "- a\n"
        "- b\n"
        "after: x\n");
    EXPECT_EQ(items(doc, {"plain"}), 2U);
    EXPECT_EQ(scalar(doc, {"plain", "1"}).text(), "2");
    EXPECT_EQ(items(doc, {"same_column"}), 2U);
    EXPECT_EQ(scalar(doc, {"same_column", "0"}).text(), "a");
    EXPECT_EQ(scalar(doc, {"after"}).text(), "x");
}

TEST_F(NodeBuilderTest, CompactMappingsInSequence) {
    const auto doc = parse_document(
        "servers:\n"
        "  - name: alpha\n"
        "    port: 8080\n"
        "  - name: beta\n"
        "    tags: [a, b]\n");
    EXPECT_EQ(items(doc, {"servers"}), 2U);
    EXPECT_THAT(keys(doc, {"servers", "0"}),
                ::testing::ElementsAre("name", "port"));
    EXPECT_EQ(scalar(doc, {"servers", "0", "port"}).as<int>(), 8080);
    EXPECT_EQ(scalar(doc, {"servers", "1", "tags", "1"}).text(), "b");
}

TEST_F(NodeBuilderTest, NestedCompactSequences) {
    const auto doc = parse_document("m:\n  - - 1\n    - 2\n  - - 3\n");
    EXPECT_EQ(items(doc, {"m"}), 2U);
    EXPECT_EQ(items(doc, {"m", "0"}), 2U);
    EXPECT_EQ(scalar(doc, {"m", "1", "0"}).text(), "3");
}

TEST_F(NodeBuilderTest, FlowCollections) {
    const auto doc =
        parse_document("a: {x: 1, y: [1, 2,], z}\nb: [k: v, w]\nc: []\n");
    EXPECT_THAT(keys(doc, {"a"}), ::testing::ElementsAre("x", "y", "z"));
    EXPECT_EQ(items(doc, {"a", "y"}), 2U);
    EXPECT_TRUE(scalar(doc, {"a", "z"}).is_null());
    EXPECT_EQ(items(doc, {"b"}), 2U);
    EXPECT_EQ(scalar(doc, {"b", "0", "k"}).text(), "v");
    EXPECT_EQ(scalar(doc, {"b", "1"}).text(), "w");
    EXPECT_EQ(items(doc, {"c"}), 0U);
}

TEST_F(NodeBuilderTest, FlowCollectionSpanningLines) {
    const auto doc = parse_document("a: [1,\n  2,\n  3]\nb: 4\n");
    EXPECT_EQ(items(doc, {"a"}), 3U);
    EXPECT_EQ(scalar(doc, {"b"}).text(), "4");
}

TEST_F(NodeBuilderTest, EmptyValuesAreNull) {
    const auto doc = parse_document("a:\nb: 1\nc:\n");
    EXPECT_TRUE(scalar(doc, {"a"}).is_null());
    EXPECT_TRUE(scalar(doc, {"c"}).is_null());
}

TEST_F(NodeBuilderTest, BlockScalarValues) {
    const auto doc = parse_document("text: |\n  one\n  two\nnext: 1\n");
    EXPECT_EQ(scalar(doc, {"text"}).text(), "one\ntwo\n");
    EXPECT_EQ(scalar(doc, {"text"}).kind(), ScalarKind::String);
}

TEST_F(NodeBuilderTest, CoreTags) {
    const auto doc = parse_document(
        "s: !!str 12\nf: !!float 1\ni: !!int \"7\"\nb: !!bool yes\n"
        "n: !!null ~\nm: !!map {a: 1}\nq: !!seq [1]\n");
    EXPECT_EQ(scalar(doc, {"s"}).kind(), ScalarKind::String);
    EXPECT_EQ(scalar(doc, {"f"}).kind(), ScalarKind::Real);
    EXPECT_EQ(scalar(doc, {"i"}).as<int>(), 7);
    EXPECT_TRUE(scalar(doc, {"b"}).as<bool>());
    EXPECT_TRUE(scalar(doc, {"n"}).is_null());
    EXPECT_EQ(items(doc, {"q"}), 1U);
}

TEST_F(NodeBuilderTest, TagErrors) {
    EXPECT_EQ(parse_error_code("a: !custom x\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: !!int abc\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: !!seq {b: 1}\n"), error::ErrorCode::Parse);
}

TEST_F(NodeBuilderTest, AliasSharesTheAnchoredNode) {
    const auto doc = parse_document("base: &b {k: 1}\nref: *b\n");
    const auto base = at(doc, {"base"});
    const auto ref = at(doc, {"ref"});
    EXPECT_FALSE(base.alias);
    EXPECT_TRUE(ref.alias);
    EXPECT_EQ(base.id, ref.id);
    EXPECT_EQ(doc.arena.node(base.id).anchor, "b");
}

TEST_F(NodeBuilderTest, MergeExplicitKeysWin) {
    const auto doc = parse_document(
        "defaults: &d {a: 1, b: 2}\nsvc: {<<: *d, b: 3}\n");
    EXPECT_EQ(scalar(doc, {"svc", "a"}).as<int>(), 1);
    EXPECT_EQ(scalar(doc, {"svc", "b"}).as<int>(), 3);
    EXPECT_THAT(keys(doc, {"svc"}), ::testing::ElementsAre("a", "b"));
}

TEST_F(NodeBuilderTest, MergeExplicitKeyBeforeMergeStillWins) {
    const auto doc = parse_document(
        "d: &d\n  a: 1\n  b: 2\nsvc:\n  b: 3\n  <<: *d\n  c: 4\n");
    EXPECT_EQ(scalar(doc, {"svc", "b"}).as<int>(), 3);
    EXPECT_THAT(keys(doc, {"svc"}), ::testing::ElementsAre("b", "a", "c"));
}

TEST_F(NodeBuilderTest, MergeListLaterSourceWins) {
    const auto doc = parse_document(
        "x: &x {k: 1}\ny: &y {k: 2}\nz:\n  <<: [*x, *y]\n");
    EXPECT_EQ(scalar(doc, {"z", "k"}).as<int>(), 2);
}

TEST_F(NodeBuilderTest, MergeInlineMapping) {
    const auto doc = parse_document("z:\n  <<: {k: 1}\n  j: 2\n");
    EXPECT_THAT(keys(doc, {"z"}), ::testing::ElementsAre("k", "j"));
}

TEST_F(NodeBuilderTest, MergeErrors) {
    EXPECT_EQ(parse_error_code("a: &s 1\nb:\n  <<: *s\n"),
              error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: &s 1\nb:\n  <<: [*s]\n"),
              error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: &m {k: 1}\nb:\n  <<: *m\n  <<: *m\n"),
              error::ErrorCode::Parse);
}

TEST_F(NodeBuilderTest, AnchorErrors) {
    EXPECT_EQ(parse_error_code("a: &x\n  b: *x\n"),
              error::ErrorCode::AnchorCycle);
    EXPECT_EQ(parse_error_code("a: &x [1, *x]\n"),
              error::ErrorCode::AnchorCycle);
    EXPECT_EQ(parse_error_code("a: *later\nb: &later 1\n"),
              error::ErrorCode::AnchorUndefined);
}

TEST_F(NodeBuilderTest, AnchorRedefinition) {
    const auto doc = parse_document("a: &x 1\nb: *x\nc: &x 2\nd: *x\n");
    EXPECT_EQ(scalar(doc, {"b"}).text(), "1");
    EXPECT_EQ(scalar(doc, {"d"}).text(), "2");

    ParseOptions strict;
    strict.allow_anchor_redefinition = false;
    try {
        (void)parse_document("a: &x 1\nc: &x 2\n", strict);
        FAIL() << "expected an AnchorError";
    } catch (const error::AnchorError& e) {
        EXPECT_EQ(e.code(), error::ErrorCode::AnchorDuplicate);
    }
}

TEST_F(NodeBuilderTest, StructuralErrors) {
    EXPECT_EQ(parse_error_code("a: 1\na: 2\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: 1\n---\nb: 2\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: [1, 2\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: {b: 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a:\n    b: 1\n  c: 2\n"),
              error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("&a k: 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a%b: 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("\"\": 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("\" k\": 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("\"k\\t\": 1\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("{'k ': 1}\n"), error::ErrorCode::Parse);
    EXPECT_EQ(parse_error_code("a: 1\n- b\n"), error::ErrorCode::Parse);
}

TEST_F(NodeBuilderTest, ErrorsCarryPosition) {
    try {
        (void)parse_document("a: 1\nb: 2\na: 3\n");
        FAIL() << "expected a ParseError";
    } catch (const error::ParseError& e) {
        ASSERT_TRUE(e.mark().has_value());
        EXPECT_EQ(e.mark()->line, 3U);
        EXPECT_EQ(e.mark()->column, 1U);
    }
}

TEST_F(NodeBuilderTest, NestingDepthIsBounded) {
    ParseOptions options;
    options.max_depth = 3;
    EXPECT_NO_THROW((void)parse_document("a: [[1]]\n", options));
    EXPECT_THROW((void)parse_document("a: [[[[1]]]]\n", options),
                 error::ParseError);
}

TEST_F(NodeBuilderTest, DeepFlowNestingDoesNotRecurse) {
    const std::string deep =
        "a: " + std::string(200, '[') + "1" + std::string(200, ']') + "\n";
    EXPECT_NO_THROW((void)parse_document(deep));
}

TEST_F(NodeBuilderTest, SeparatorFollowsOptions) {
    ParseOptions options;
    options.separator = '/';
    EXPECT_NO_THROW((void)parse_document("a%b: 1\n", options));
    EXPECT_THROW((void)parse_document("a/b: 1\n", options), error::ParseError);
}

}  // namespace yconf::parser::test
