#include <catch2/catch_test_macros.hpp>

#include "processing/Segmenter.hpp"
#include "processing/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <string>

using namespace processing;

namespace
{

SegmentedDocument segment_or_fail(const std::string& text, const SegmentOptions& opts)
{
    SegmentedDocument doc;
    std::string error;
    REQUIRE(segment_document(text, opts, doc, error));
    REQUIRE(error.empty());
    return doc;
}

std::string upper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> contents(const SegmentedDocument& doc)
{
    std::vector<std::string> out;
    for (const auto& seg : doc.segments)
        out.push_back(seg.content);
    return out;
}

std::string to_utf8(std::u32string_view view)
{
    return utf32ToUtf8(view);
}

} // namespace

TEST_CASE("Empty input yields no segments", "[segmenter]")
{
    auto doc = segment_or_fail("", SegmentOptions{});
    REQUIRE(doc.empty());
    REQUIRE(doc.merge().empty());
}

TEST_CASE("Front matter becomes one pass-through segment", "[segmenter]")
{
    const std::string text = "---\ntitle: Hi\n---\nBody text.\n";

    SECTION("Preserved by default")
    {
        auto doc = segment_or_fail(text, SegmentOptions{});
        REQUIRE(doc.size() == 2);
        REQUIRE(doc.segments[0].content == "---\ntitle: Hi\n---\n");
        REQUIRE(doc.segments[0].kind == SegmentKind::FrontMatter);
        REQUIRE_FALSE(doc.segments[0].translate);
        REQUIRE(doc.segments[1].content == "Body text.\n");
        REQUIRE(doc.segments[1].translate);
        REQUIRE(doc.merge() == text);
    }

    SECTION("Translated as text when not preserved")
    {
        SegmentOptions opts;
        opts.preserve_frontmatter = false;
        auto doc = segment_or_fail(text, opts);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.segments[0].kind == SegmentKind::Text);
        REQUIRE(doc.segments[0].content == text);
    }

    SECTION("Unclosed front matter is ordinary text")
    {
        auto doc = segment_or_fail("---\ntitle: Hi\nBody\n", SegmentOptions{});
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.segments[0].kind == SegmentKind::Text);
    }
}

TEST_CASE("Fenced code blocks are kept verbatim", "[segmenter]")
{
    SECTION("Closed fence between text")
    {
        const std::string text = "Intro.\n\n```cpp\nint x;\n```\nOutro.\n";
        auto doc = segment_or_fail(text, SegmentOptions{});
        REQUIRE(contents(doc) == std::vector<std::string>{ "Intro.\n\n", "```cpp\nint x;\n```\n", "Outro.\n" });
        REQUIRE(doc.segments[1].kind == SegmentKind::Code);
        REQUIRE_FALSE(doc.segments[1].translate);
        REQUIRE(doc.merge() == text);
    }

    SECTION("Only a run of the same length closes the fence")
    {
        const std::string text = "````\n```\ninner\n````\nafter\n";
        auto doc = segment_or_fail(text, SegmentOptions{});
        REQUIRE(contents(doc) == std::vector<std::string>{ "````\n```\ninner\n````\n", "after\n" });
    }

    SECTION("Unterminated fence runs to the end of the document")
    {
        auto doc = segment_or_fail("Text\n~~~\ncode\nmore", SegmentOptions{});
        REQUIRE(contents(doc) == std::vector<std::string>{ "Text\n", "~~~\ncode\nmore" });
        REQUIRE(doc.segments.back().kind == SegmentKind::Code);
    }

    SECTION("Fences are ordinary text when code is translated")
    {
        SegmentOptions opts;
        opts.preserve_code = false;
        auto doc = segment_or_fail("Intro.\n```\nint x;\n```\n", opts);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.segments[0].translate);
    }

    SECTION("Indexes follow document order")
    {
        auto doc = segment_or_fail("a\n```\nb\n```\nc\n", SegmentOptions{});
        for (std::size_t i = 0; i < doc.size(); ++i)
            REQUIRE(doc.segments[i].index == i);
    }
}

TEST_CASE("Short lines are packed under max_chars", "[segmenter]")
{
    const std::string text = "First line.\nSecond line that is longer.\nThird line.";
    SegmentOptions opts;
    opts.max_chars = 12;

    auto doc = segment_or_fail(text, opts);
    std::size_t translatable = 0;
    for (const auto& seg : doc.segments)
    {
        if (!seg.translate)
            continue;
        ++translatable;
        REQUIRE(codepointLength(seg.content) <= 12);
    }
    REQUIRE(translatable >= 2);

    for (auto& seg : doc.segments)
        seg.translation = upper(seg.content);

    auto reference = segment_or_fail(text, opts);
    std::string expected;
    for (const auto& seg : reference.segments)
        expected += upper(seg.content);
    REQUIRE(doc.merge() == expected);
}

TEST_CASE("Segmentation invariants", "[segmenter]")
{
    std::string text = "# Title\n\n";
    for (int i = 0; i < 12; ++i)
    {
        text += "Paragraph " + std::to_string(i) + " has a few sentences. Some are short! Others run on for a "
                "while before they stop? Yes.\n\n";
        text += "これは日本語の文です。もう一つの文があります。\n\n";
    }
    text += "```\nfn main() {}\n```\n";
    text += std::string(90, 'x') + "\n";

    SegmentOptions opts;
    opts.max_chars = 40;

    SECTION("Merge reproduces the input")
    {
        auto doc = segment_or_fail(text, opts);
        REQUIRE(doc.merge() == text);
    }

    SECTION("Every translatable segment respects the limit")
    {
        auto doc = segment_or_fail(text, opts);
        for (const auto& seg : doc.segments)
        {
            if (seg.translate)
                REQUIRE(codepointLength(seg.content) <= 40);
        }
    }

    SECTION("Repeated calls give identical boundaries")
    {
        REQUIRE(contents(segment_or_fail(text, opts)) == contents(segment_or_fail(text, opts)));
    }

    SECTION("A non-positive limit disables splitting")
    {
        opts.max_chars = 0;
        auto doc = segment_or_fail("One. Two. Three.\n\nFour.\n", opts);
        REQUIRE(doc.size() == 1);
    }
}

TEST_CASE("split_threshold keeps short documents whole", "[segmenter]")
{
    const std::string text = "Alpha beta. Gamma delta.\n\nEpsilon zeta eta theta.";
    SegmentOptions opts;
    opts.max_chars = 10;

    SECTION("At or below the threshold")
    {
        opts.split_threshold = 100;
        auto doc = segment_or_fail(text, opts);
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.segments[0].content == text);
    }

    SECTION("Above the threshold")
    {
        opts.split_threshold = 20;
        auto doc = segment_or_fail(text, opts);
        REQUIRE(doc.size() > 1);
        for (const auto& seg : doc.segments)
            REQUIRE(codepointLength(seg.content) <= 10);
    }
}

TEST_CASE("Segmentation errors", "[segmenter]")
{
    SegmentedDocument doc;
    std::string error;

    SECTION("Unknown strategy")
    {
        SegmentOptions opts;
        opts.strategy = "html";
        REQUIRE_FALSE(segment_document("text", opts, doc, error));
        REQUIRE(error.find("Unsupported") != std::string::npos);
    }

    SECTION("Invalid UTF-8")
    {
        REQUIRE_FALSE(segment_document("ok \xff\xfe", SegmentOptions{}, doc, error));
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("Paragraph and sentence splitting", "[segmenter]")
{
    SECTION("Blank-line separators are separate tokens")
    {
        const std::u32string text = U"a\n\nb";
        auto tokens = split_paragraphs(text);
        REQUIRE(tokens.size() == 3);
        REQUIRE(to_utf8(tokens[0]) == "a");
        REQUIRE(to_utf8(tokens[1]) == "\n\n");
        REQUIRE(to_utf8(tokens[2]) == "b");
    }

    SECTION("Single newlines do not split paragraphs")
    {
        REQUIRE(split_paragraphs(U"line one\nline two").size() == 1);
    }

    SECTION("Sentences keep their trailing space")
    {
        const std::u32string text = U"Hello world. How are you? Fine";
        auto sentences = split_sentences(text);
        REQUIRE(sentences.size() == 3);
        REQUIRE(to_utf8(sentences[0]) == "Hello world. ");
        REQUIRE(to_utf8(sentences[1]) == "How are you? ");
        REQUIRE(to_utf8(sentences[2]) == "Fine");
    }

    SECTION("Full-width terminators")
    {
        auto sentences = split_sentences(U"一つ。 二つ！ 三つ");
        REQUIRE(sentences.size() == 3);
    }

    SECTION("Oversized sentences are hard-wrapped")
    {
        const std::u32string text(25, U'z');
        auto parts = enforce_max_chars(text, 10);
        REQUIRE(parts.size() == 3);
        REQUIRE(parts[0].size() == 10);
        REQUIRE(parts[2].size() == 5);
    }
}

TEST_CASE("Whitespace-only text segments need no translation", "[segmenter]")
{
    Segment seg;
    seg.content = " \n\t\n";
    REQUIRE(seg.translate);
    REQUIRE_FALSE(seg.needsTranslation());
    seg.content = "word";
    REQUIRE(seg.needsTranslation());
}
