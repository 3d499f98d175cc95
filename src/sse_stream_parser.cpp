#include "sse_stream_parser.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace avatar_tutor {

namespace {
const std::string DATA_PREFIX = "data: ";
const std::string DONE_SENTINEL = "[DONE]";
}

SseStreamParser::SseStreamParser(bool all_choices)
    : all_choices_(all_choices) {}

std::vector<std::string> SseStreamParser::feed(const std::string& bytes) {
    std::vector<std::string> out;
    buffer_ += bytes;

    size_t start = 0;
    size_t nl;
    while ((nl = buffer_.find('\n', start)) != std::string::npos) {
        std::string line = buffer_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        parse_line(line, out);
        start = nl + 1;
    }
    buffer_.erase(0, start);
    return out;
}

std::vector<std::string> SseStreamParser::finish() {
    std::vector<std::string> out;
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        parse_line(line, out);
    }
    return out;
}

void SseStreamParser::parse_line(const std::string& line, std::vector<std::string>& out) {
    if (line.empty() || line.compare(0, DATA_PREFIX.size(), DATA_PREFIX) != 0) {
        return;
    }
    std::string payload = line.substr(DATA_PREFIX.size());
    if (payload.size() >= DONE_SENTINEL.size() &&
        payload.compare(payload.size() - DONE_SENTINEL.size(), DONE_SENTINEL.size(), DONE_SENTINEL) == 0) {
        done_ = true;
        return;
    }

    json chunk;
    try {
        chunk = json::parse(payload);
    } catch (const json::exception& e) {
        ++malformed_count_;
        last_error_ = Error(ErrorType::ParseError, e.what());
        LOG_DEBUG(std::string("Skipping malformed stream line (") +
                  error_type_name(last_error_.type) + "): " + e.what());
        return;
    }

    if (!chunk.is_object() || !chunk.contains("choices") || !chunk["choices"].is_array()) {
        return;
    }

    for (const auto& choice : chunk["choices"]) {
        if (choice.is_object() && choice.contains("delta") && choice["delta"].is_object()) {
            const auto& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                std::string content = delta["content"].get<std::string>();
                if (content == DONE_SENTINEL) {
                    content.clear();
                }
                content = utils::remove_doc_references(content);
                if (!content.empty()) {
                    out.push_back(std::move(content));
                }
            }
        }
        if (!all_choices_) {
            break;
        }
    }
}

} // namespace avatar_tutor
