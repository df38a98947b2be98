#include <catch2/catch_test_macros.hpp>

#include "translate/BatchCodec.hpp"

#include <string>

using namespace translate;

namespace {

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += kSegmentDelimiter;
        out += parts[i];
    }
    return out;
}

}  // namespace

TEST_CASE("Batch encoding marks every segment", "[translate][codec]") {
    const auto encoded = encode_batch({"Hello", "World\n"});
    REQUIRE(encoded == "<<<SEGMENT 1>>>\nHello\n<<<END SEGMENT 1>>>\n"
                       "<<<SEGMENT 2>>>\nWorld\n<<<END SEGMENT 2>>>\n");

    const auto instructions = batch_instructions(2);
    REQUIRE(instructions.find("exactly 2 translations") != std::string::npos);
    REQUIRE(instructions.find(kSegmentDelimiter) != std::string::npos);
}

TEST_CASE("Batch responses are split on the delimiter", "[translate][codec]") {
    SECTION("Exact count") {
        auto parsed = parse_batch_response(join({"Bonjour", "Salut"}), 2);
        REQUIRE(parsed.ok);
        REQUIRE(parsed.translations == std::vector<std::string>{"Bonjour", "Salut"});
    }

    SECTION("Trailing delimiter and whitespace are dropped") {
        auto parsed = parse_batch_response("Bonjour" + std::string(kSegmentDelimiter) + "Salut" +
                                               std::string(kSegmentDelimiter) + "\n",
                                           2);
        REQUIRE(parsed.ok);
        REQUIRE(parsed.translations.back() == "Salut");
    }

    SECTION("Too few translations") {
        auto parsed = parse_batch_response("Bonjour et salut", 2);
        REQUIRE_FALSE(parsed.ok);
        REQUIRE(parsed.expected == 2);
        REQUIRE(parsed.received == 1);
        REQUIRE(parsed.translations.empty());
    }

    SECTION("Too many translations") {
        auto parsed = parse_batch_response(join({"a", "b", "c"}), 2);
        REQUIRE_FALSE(parsed.ok);
        REQUIRE(parsed.received == 3);
    }

    SECTION("A blank fragment between translations is rejected") {
        auto parsed = parse_batch_response("Alfa.\n" + std::string(kSegmentDelimiter) + "\n\n" +
                                               std::string(kSegmentDelimiter) + "\nGama.",
                                           3);
        REQUIRE_FALSE(parsed.ok);
        REQUIRE(parsed.received == 3);
        REQUIRE(parsed.blank == 1);
        REQUIRE(parsed.translations.empty());
    }

    SECTION("A blank first fragment is rejected") {
        auto parsed = parse_batch_response(join({" ", "b"}), 2);
        REQUIRE_FALSE(parsed.ok);
        REQUIRE(parsed.blank == 1);
    }
}

TEST_CASE("Edge whitespace follows the source", "[translate][codec]") {
    REQUIRE(restore_edge_whitespace("\n\nHello world.\n\n", "Bonjour le monde.") == "\n\nBonjour le monde.\n\n");
    REQUIRE(restore_edge_whitespace("Hello\n", "\n  Bonjour  \n") == "Bonjour\n");
    REQUIRE(restore_edge_whitespace("Hello", "Bonjour") == "Bonjour");
    REQUIRE(restore_edge_whitespace("   ", "x") == "x");
}
