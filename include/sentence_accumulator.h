#pragma once

#include <optional>
#include <string>
#include <vector>

namespace avatar_tutor {

/**
 * @brief Turns a streamed token sequence into speakable sentence units
 *
 * Fragments are appended to an internal buffer; every terminal found in the
 * buffer closes a unit that runs up to and including the terminal.
 * Concatenating every string returned by accept()/flush() since the last
 * reset() reproduces the input exactly.
 *
 * Boundary policy is deliberately naive: any terminal is a boundary, with no
 * lookahead. "3.14" splits after "3." and "Dr. Smith" after "Dr.". An early
 * split only changes speech cadence, so this is the accepted behavior.
 *
 * Not thread-safe; the owning session serializes access.
 */
class SentenceAccumulator {
public:
    /// Uses the default terminals: . ? ! : ; and their full-width forms
    SentenceAccumulator();

    /**
     * @param terminals Sentence terminals, each one UTF-8 code point
     */
    explicit SentenceAccumulator(std::vector<std::string> terminals);

    /**
     * @brief Append a fragment and return the sentences it completed, in order
     */
    std::vector<std::string> accept(const std::string& fragment);

    /**
     * @brief Emit whatever is buffered as a final unit
     * @return Remaining text, or nullopt if the buffer is empty
     */
    std::optional<std::string> flush();

    /// Drop buffered text and the emitted count
    void reset();

    /// Units returned by accept()/flush() since the last reset()
    size_t emitted_count() const { return emitted_count_; }

    /// Bytes of the current unterminated sentence
    size_t buffered_size() const { return buffer_.size(); }

    static const std::vector<std::string>& default_terminals();

private:
    /// Length of the terminal starting at pos, 0 if none
    size_t terminal_at(size_t pos) const;

    std::vector<std::string> terminals_;
    size_t longest_terminal_ = 1;
    std::string buffer_;
    size_t scan_pos_ = 0;  ///< No terminal can start before this offset
    size_t emitted_count_ = 0;
};

} // namespace avatar_tutor
