#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace translate {

// Reserved separator the service is asked to place between translations of a batch.
inline constexpr const char* kSegmentDelimiter = "<<<TRANSFOLD_SEGMENT_BREAK>>>";

// Builds the user-message body for a multi-text request. Every text is wrapped in
// numbered begin/end markers so the service can tell where each one starts and stops.
std::string encode_batch(const std::vector<std::string>& texts);

// Instruction line placed above the encoded batch.
std::string batch_instructions(std::size_t count);

struct BatchParseResult
{
    bool ok = false;
    std::vector<std::string> translations;
    std::size_t expected = 0;
    std::size_t received = 0;
    std::size_t blank = 0;
};

// Splits a reply on kSegmentDelimiter. Whitespace-only fragments after the last real
// translation are dropped; the remaining count must equal expected and none of the
// remaining fragments may be blank.
BatchParseResult parse_batch_response(const std::string& message, std::size_t expected);

// Re-applies the source text's leading and trailing whitespace to a translation, so
// paragraph breaks between segments survive services that trim their replies.
std::string restore_edge_whitespace(const std::string& source, const std::string& translation);

} // namespace translate
