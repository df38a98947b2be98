// Catch2WithMain provides main(); this file only holds a quick end-to-end smoke test.

#include <catch2/catch_test_macros.hpp>

#include "processing/Segmenter.hpp"
#include "translate/BatchScheduler.hpp"
#include "utils/mock_translator.hpp"

TEST_CASE("Segment, translate and merge a small document", "[smoke]")
{
    const std::string text = "---\ntitle: Hi\n---\n# Hello\n\nWorld.\n\n```\ncode\n```\n";

    processing::SegmentedDocument doc;
    std::string error;
    REQUIRE(processing::segment_document(text, {}, doc, error));
    REQUIRE(doc.merge() == text);

    test_utils::MockTranslator translator;
    translate::SchedulerOptions opts;
    opts.target_lang = "fr";
    translate::BatchScheduler scheduler(translator, opts);
    REQUIRE(scheduler.translate(doc.segments).success);

    const auto merged = doc.merge();
    REQUIRE(merged.rfind("---\ntitle: Hi\n---\n", 0) == 0);
    REQUIRE(merged.find("[fr] ") != std::string::npos);
    REQUIRE(merged.find("```\ncode\n```\n") != std::string::npos);
}
