#include "sentence_accumulator.h"
#include <algorithm>

namespace avatar_tutor {

const std::vector<std::string>& SentenceAccumulator::default_terminals() {
    static const std::vector<std::string> terminals = {
        ".", "?", "!", ":", ";",
        "\xE3\x80\x82",  // 。
        "\xEF\xBC\x9F",  // ？
        "\xEF\xBC\x81",  // ！
        "\xEF\xBC\x9A",  // ：
        "\xEF\xBC\x9B"   // ；
    };
    return terminals;
}

SentenceAccumulator::SentenceAccumulator()
    : SentenceAccumulator(default_terminals()) {}

SentenceAccumulator::SentenceAccumulator(std::vector<std::string> terminals)
    : terminals_(std::move(terminals)) {
    // Empty entries would match everywhere
    terminals_.erase(std::remove_if(terminals_.begin(), terminals_.end(),
                                    [](const std::string& t) { return t.empty(); }),
                     terminals_.end());
    for (const auto& t : terminals_) {
        longest_terminal_ = std::max(longest_terminal_, t.size());
    }
}

size_t SentenceAccumulator::terminal_at(size_t pos) const {
    for (const auto& t : terminals_) {
        if (buffer_.compare(pos, t.size(), t) == 0) {
            return t.size();
        }
    }
    return 0;
}

std::vector<std::string> SentenceAccumulator::accept(const std::string& fragment) {
    std::vector<std::string> sentences;
    if (fragment.empty()) {
        return sentences;
    }
    buffer_ += fragment;

    size_t start = 0;
    size_t pos = scan_pos_;
    while (pos < buffer_.size()) {
        size_t len = terminal_at(pos);
        if (len > 0 && pos + len <= buffer_.size()) {
            sentences.push_back(buffer_.substr(start, pos + len - start));
            pos += len;
            start = pos;
        } else {
            ++pos;
        }
    }

    if (start > 0) {
        buffer_.erase(0, start);
    }
    // A multi-byte terminal may still be arriving across the fragment edge
    scan_pos_ = buffer_.size() >= longest_terminal_ ? buffer_.size() - (longest_terminal_ - 1) : 0;

    emitted_count_ += sentences.size();
    return sentences;
}

std::optional<std::string> SentenceAccumulator::flush() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string rest;
    rest.swap(buffer_);
    scan_pos_ = 0;
    ++emitted_count_;
    return rest;
}

void SentenceAccumulator::reset() {
    buffer_.clear();
    scan_pos_ = 0;
    emitted_count_ = 0;
}

} // namespace avatar_tutor
