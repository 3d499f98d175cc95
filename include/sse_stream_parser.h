#pragma once

/**
 * @file sse_stream_parser.h
 * @brief Incremental parser for chat-completions server-sent events
 *
 * Bytes arrive from the transport in arbitrary chunks. Complete lines are
 * split out, "data: " payloads are decoded as JSON and the delta content of
 * each choice is returned as a fragment. The "[DONE]" sentinel and payloads
 * that are not valid JSON are skipped.
 */

#include "errors.h"
#include <string>
#include <vector>

namespace avatar_tutor {

class SseStreamParser {
public:
    /**
     * @param all_choices Take content from every choice (retrieval responses)
     *        instead of only the first
     */
    explicit SseStreamParser(bool all_choices = false);

    /**
     * @brief Consume a chunk of the response body
     * @return Non-empty content fragments completed by this chunk, in order
     */
    std::vector<std::string> feed(const std::string& bytes);

    /**
     * @brief Process a trailing line that had no newline
     */
    std::vector<std::string> finish();

    /// Number of data lines skipped because they did not parse
    size_t malformed_count() const { return malformed_count_; }

    /// ParseError describing the most recent skipped line (None if none)
    const Error& last_error() const { return last_error_; }

    /// True once the "[DONE]" sentinel has been seen
    bool done() const { return done_; }

private:
    void parse_line(const std::string& line, std::vector<std::string>& out);

    bool all_choices_;
    std::string buffer_;
    size_t malformed_count_ = 0;
    Error last_error_;
    bool done_ = false;
};

} // namespace avatar_tutor
