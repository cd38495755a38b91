// tests/test_tokenizer.cpp
// @brief Classification rules of the tokenizer and their distribution over lines.
// @invariant Every line carries exactly one tag per byte after a scan.
// @ownership Buffers and tokenizers are owned by each test.

#include "TestHarness.hpp"

#include "quill/syntax/language.hpp"
#include "quill/syntax/tokenizer.hpp"
#include "quill/text/buffer.hpp"

#include <string>
#include <vector>

using quill::syntax::HighlightTag;
using quill::syntax::LanguageMode;
using quill::syntax::Tokenizer;
using quill::text::Buffer;

namespace
{
Buffer rustBuffer(const std::string &content)
{
    Buffer buffer(quill::syntax::makeHighlighter("rust"));
    buffer.load(content);
    return buffer;
}

void expectRun(const std::vector<HighlightTag> &tags,
               std::size_t from,
               std::size_t count,
               HighlightTag tag)
{
    for (std::size_t i = from; i < from + count; ++i)
    {
        ASSERT_TRUE(i < tags.size());
        EXPECT_TRUE(tags[i] == tag);
    }
}
} // namespace

TEST(Tokenizer, ClassifiesLetStatementWithComment)
{
    const Buffer buffer = rustBuffer("let x = 42; // note");
    const auto &tags = buffer.line(0).tags();
    ASSERT_EQ(tags.size(), buffer.line(0).size());

    expectRun(tags, 0, 3, HighlightTag::Keyword);
    expectRun(tags, 3, 1, HighlightTag::Standard);
    expectRun(tags, 4, 1, HighlightTag::Identifier);
    expectRun(tags, 5, 3, HighlightTag::Standard);
    expectRun(tags, 8, 2, HighlightTag::Number);
    expectRun(tags, 10, 2, HighlightTag::Standard);
    expectRun(tags, 12, 7, HighlightTag::Comment);
}

TEST(Tokenizer, NestedBlockCommentClosesAtDepthZero)
{
    const Buffer buffer = rustBuffer("/* a /* b */ c */ d");
    const auto &tags = buffer.line(0).tags();
    expectRun(tags, 0, 17, HighlightTag::Comment);
    expectRun(tags, 17, 1, HighlightTag::Standard);
    expectRun(tags, 18, 1, HighlightTag::Identifier);
}

TEST(Tokenizer, BlockCommentSpansLines)
{
    const Buffer buffer = rustBuffer("x /* open\nstill */ y");
    expectRun(buffer.line(0).tags(), 0, 1, HighlightTag::Identifier);
    expectRun(buffer.line(0).tags(), 2, 7, HighlightTag::Comment);
    expectRun(buffer.line(1).tags(), 0, 8, HighlightTag::Comment);
    expectRun(buffer.line(1).tags(), 8, 1, HighlightTag::Standard);
    expectRun(buffer.line(1).tags(), 9, 1, HighlightTag::Identifier);
}

TEST(Tokenizer, LineCommentStopsAtLineEnd)
{
    const Buffer buffer = rustBuffer("// one\nfn");
    expectRun(buffer.line(0).tags(), 0, 6, HighlightTag::Comment);
    expectRun(buffer.line(1).tags(), 0, 2, HighlightTag::Keyword);
}

TEST(Tokenizer, UnterminatedStringRunsToEndOfBuffer)
{
    const Buffer buffer = rustBuffer("s = \"abc\ndef\nx");
    expectRun(buffer.line(0).tags(), 0, 1, HighlightTag::Identifier);
    expectRun(buffer.line(0).tags(), 4, 4, HighlightTag::String);
    expectRun(buffer.line(1).tags(), 0, 3, HighlightTag::String);
    expectRun(buffer.line(2).tags(), 0, 1, HighlightTag::String);
}

TEST(Tokenizer, EscapedQuoteStaysInsideString)
{
    const Buffer buffer = rustBuffer("\"a\\\"b\" c");
    const auto &tags = buffer.line(0).tags();
    expectRun(tags, 0, 6, HighlightTag::String);
    expectRun(tags, 6, 1, HighlightTag::Standard);
    expectRun(tags, 7, 1, HighlightTag::Identifier);
}

TEST(Tokenizer, NumbersAcceptSeparatorsAfterFirstDigit)
{
    EXPECT_EQ(Tokenizer::numberLength("3.14_f"), 5u);
    EXPECT_EQ(Tokenizer::numberLength("_1"), 0u);
    EXPECT_EQ(Tokenizer::wordLength("x1 y"), 2u);
    EXPECT_EQ(Tokenizer::wordLength("1x"), 0u);

    const Buffer buffer = rustBuffer("3.14_f");
    expectRun(buffer.line(0).tags(), 0, 5, HighlightTag::Number);
    expectRun(buffer.line(0).tags(), 5, 1, HighlightTag::Identifier);
}

TEST(Tokenizer, BracketsAreSingleCharacters)
{
    const Buffer buffer = rustBuffer("f(a[0]){}");
    const auto &tags = buffer.line(0).tags();
    EXPECT_TRUE(tags[1] == HighlightTag::Bracket);
    EXPECT_TRUE(tags[3] == HighlightTag::Bracket);
    EXPECT_TRUE(tags[4] == HighlightTag::Number);
    EXPECT_TRUE(tags[5] == HighlightTag::Bracket);
    expectRun(tags, 6, 3, HighlightTag::Bracket);
}

TEST(Tokenizer, LongerCommentFormWins)
{
    // Delimiters overlap, so both comment rules apply at the same position.
    static constexpr std::string_view kLuaKeywords[] = {"local"};
    const LanguageMode lua{"lua", kLuaKeywords, "--", "--[[", "]]"};

    EXPECT_EQ(Tokenizer::lineCommentLength("--[[ a ]] b\nc", "--"), 12u);
    EXPECT_EQ(Tokenizer::blockCommentLength("--[[ a ]] b\nc", "--[[", "]]"), 9u);
    EXPECT_EQ(Tokenizer::lineCommentLength("--[[ a\nb ]] c", "--"), 7u);
    EXPECT_EQ(Tokenizer::blockCommentLength("--[[ a\nb ]] c", "--[[", "]]"), 11u);

    const Tokenizer tokenizer(lua);
    const auto lineWins = tokenizer.scan("--[[ a ]] b\nc");
    expectRun(lineWins, 0, 12, HighlightTag::Comment);
    expectRun(lineWins, 12, 1, HighlightTag::Identifier);

    const auto blockWins = tokenizer.scan("--[[ a\nb ]] c");
    expectRun(blockWins, 0, 11, HighlightTag::Comment);
    expectRun(blockWins, 11, 1, HighlightTag::Standard);
    expectRun(blockWins, 12, 1, HighlightTag::Identifier);
}

TEST(Tokenizer, KeywordSetDependsOnMode)
{
    Buffer c(quill::syntax::makeHighlighter("c"));
    c.load(std::string("int fn"));
    EXPECT_TRUE(c.line(0).tags()[0] == HighlightTag::Keyword);
    EXPECT_TRUE(c.line(0).tags()[4] == HighlightTag::Identifier);

    const Buffer rust = rustBuffer("int fn");
    EXPECT_TRUE(rust.line(0).tags()[0] == HighlightTag::Identifier);
    EXPECT_TRUE(rust.line(0).tags()[4] == HighlightTag::Keyword);
}

TEST(Tokenizer, RetokenizeIsIdempotent)
{
    Buffer buffer = rustBuffer("fn main() {\n    let s = \"hi\"; /* x */\n}");
    std::vector<std::vector<HighlightTag>> before;
    for (const auto &line : buffer.lines())
        before.push_back(line.tags());
    buffer.retokenize();
    for (std::size_t i = 0; i < buffer.lineCount(); ++i)
        EXPECT_TRUE(buffer.line(i).tags() == before[i]);
}

TEST(Tokenizer, ColourIsPaletteLookup)
{
    const Tokenizer tokenizer(*quill::syntax::findLanguage("rust"));
    const auto palette = quill::syntax::Palette::defaults();
    EXPECT_TRUE(tokenizer.colour(HighlightTag::Keyword) == palette[HighlightTag::Keyword]);
    EXPECT_TRUE(tokenizer.colour(HighlightTag::SearchResult) ==
                palette[HighlightTag::SearchResult]);
}

TEST(Language, ModesAndExtensions)
{
    EXPECT_TRUE(quill::syntax::makeHighlighter("plain") == nullptr);
    EXPECT_TRUE(quill::syntax::findLanguage("cobol") == nullptr);
    ASSERT_TRUE(quill::syntax::findLanguage("cpp") != nullptr);
    EXPECT_TRUE(quill::syntax::findLanguage("cpp")->isKeyword("namespace"));
    EXPECT_FALSE(quill::syntax::findLanguage("c")->isKeyword("namespace"));

    EXPECT_EQ(quill::syntax::languageForPath("src/main.rs"), "rust");
    EXPECT_EQ(quill::syntax::languageForPath("a/b.H"), "c");
    EXPECT_EQ(quill::syntax::languageForPath("lib.hpp"), "cpp");
    EXPECT_EQ(quill::syntax::languageForPath("notes.md"), "plain");
    EXPECT_EQ(quill::syntax::languageForPath("Makefile"), "rust");
    EXPECT_EQ(quill::syntax::languageForPath(""), "rust");
}

int main(int argc, char **argv)
{
    quill_test::init(&argc, &argv);
    return quill_test::run_all_tests();
}
