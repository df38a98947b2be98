#include <catch2/catch_test_macros.hpp>

#include "output/OrderedEmitter.hpp"

#include <string>
#include <thread>
#include <vector>

namespace
{

processing::SegmentedDocument make_document(std::size_t count)
{
    processing::SegmentedDocument doc;
    for (std::size_t i = 0; i < count; ++i)
    {
        processing::Segment seg;
        seg.index = i;
        seg.content = "s" + std::to_string(i) + "\n";
        doc.segments.push_back(seg);
    }
    return doc;
}

} // namespace

TEST_CASE("Ordered emitter releases contiguous prefixes", "[emitter]")
{
    auto doc = make_document(5);
    std::vector<std::string> chunks;
    output::OrderedEmitter emitter(doc, [&](const std::string& chunk) { chunks.push_back(chunk); });

    SECTION("Reverse completion emits everything at once")
    {
        for (std::size_t i = doc.size(); i-- > 0;)
        {
            doc.segments[i].translation = "t" + std::to_string(i) + "\n";
            emitter.onSegmentReady(doc.segments[i]);
            if (i > 0)
                REQUIRE(chunks.empty());
        }
        REQUIRE(chunks.size() == 1);
        REQUIRE(chunks.front() == doc.merge());
        REQUIRE(emitter.complete());
    }

    SECTION("Out of order completion never leaves a gap")
    {
        const std::size_t order[] = { 1, 0, 3, 4, 2 };
        std::string emitted;
        for (auto i : order)
        {
            doc.segments[i].translation = "t" + std::to_string(i) + "\n";
            emitter.onSegmentReady(doc.segments[i]);
            std::string joined;
            for (const auto& c : chunks)
                joined += c;
            REQUIRE(doc.merge().rfind(joined, 0) == 0);
        }
        REQUIRE(chunks == std::vector<std::string>{ "t0\nt1\n", "t2\nt3\nt4\n" });
        REQUIRE(emitter.chunksEmitted() == 2);
    }

    SECTION("Repeated notifications are ignored")
    {
        doc.segments[0].translation = "t0\n";
        emitter.onSegmentReady(doc.segments[0]);
        emitter.onSegmentReady(doc.segments[0]);
        REQUIRE(chunks.size() == 1);
        REQUIRE(emitter.nextIndex() == 1);
    }
}

TEST_CASE("Ordered emitter tolerates concurrent completions", "[emitter]")
{
    auto doc = make_document(64);
    std::string output;
    output::OrderedEmitter emitter(doc, [&](const std::string& chunk) { output += chunk; });

    for (auto& seg : doc.segments)
        seg.translation = "x" + seg.content;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&, t]() {
            for (std::size_t i = static_cast<std::size_t>(t); i < doc.size(); i += 4)
                emitter.onSegmentReady(doc.segments[i]);
        });
    }
    for (auto& th : threads)
        th.join();

    REQUIRE(emitter.complete());
    REQUIRE(output == doc.merge());
}
