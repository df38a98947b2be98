#include <catch2/catch_test_macros.hpp>

#include "processing/TextUtils.hpp"
#include "utils/BoundedQueue.hpp"
#include "utils/LRUCache.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace processing;

TEST_CASE("Code point length", "[text_utils]")
{
    REQUIRE(codepointLength("") == 0);
    REQUIRE(codepointLength("hello") == 5);
    REQUIRE(codepointLength("h\xC3\xA9llo") == 5);
    REQUIRE(codepointLength("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E") == 3);
}

TEST_CASE("UTF-8 validation", "[text_utils]")
{
    SECTION("Accepts well-formed text")
    {
        REQUIRE(isValidUtf8(""));
        REQUIRE(isValidUtf8("plain ascii"));
        REQUIRE(isValidUtf8("\xE3\x81\x82\xF0\x9F\x98\x80"));
    }

    SECTION("Rejects overlong encodings")
    {
        REQUIRE_FALSE(isValidUtf8("\xC0\xAF"));
    }

    SECTION("Rejects surrogates")
    {
        REQUIRE_FALSE(isValidUtf8("\xED\xA0\x80"));
    }

    SECTION("Rejects truncated sequences")
    {
        REQUIRE_FALSE(isValidUtf8("abc\xE3\x81"));
    }
}

TEST_CASE("UTF-32 conversion keeps every code point", "[text_utils]")
{
    const std::string text = "a\xC3\xA9\xE3\x81\x82\xF0\x9F\x98\x80";
    const auto wide = utf8ToUtf32(text);
    REQUIRE(wide.size() == 4);
    REQUIRE(wide[3] == U'\U0001F600');
    REQUIRE(utf32ToUtf8(wide) == text);
}

TEST_CASE("Blank detection", "[text_utils]")
{
    REQUIRE(isBlank(""));
    REQUIRE(isBlank(" \t\r\n"));
    REQUIRE(isBlank("\xE3\x80\x80"));
    REQUIRE_FALSE(isBlank(" x "));
}

TEST_CASE("LRU cache evicts the least recently used entry", "[lru]")
{
    utils::LRUCache<std::string, int> cache(2);
    cache.put("a", 1);
    cache.put("b", 2);

    int value = 0;
    REQUIRE(cache.get("a", value));
    REQUIRE(value == 1);

    cache.put("c", 3);
    REQUIRE(cache.size() == 2);
    REQUIRE(cache.contains("a"));
    REQUIRE_FALSE(cache.contains("b"));
    REQUIRE(cache.contains("c"));

    SECTION("Updating an entry keeps the size")
    {
        REQUIRE_FALSE(cache.put("a", 10));
        REQUIRE(cache.get("a", value));
        REQUIRE(value == 10);
        REQUIRE(cache.size() == 2);
    }
}

TEST_CASE("Bounded queue drains after close", "[bounded_queue]")
{
    utils::BoundedQueue<int> queue(2);
    std::vector<int> received;

    std::thread consumer([&]() {
        while (auto item = queue.pop())
            received.push_back(*item);
    });

    for (int i = 0; i < 10; ++i)
        REQUIRE(queue.push(i));
    queue.close();
    consumer.join();

    REQUIRE(received.size() == 10);
    for (int i = 0; i < 10; ++i)
        REQUIRE(received[static_cast<std::size_t>(i)] == i);
    REQUIRE_FALSE(queue.push(11));
}
