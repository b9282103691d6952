#include "sse_processor.hpp"
#include "../util.hpp"
#include <charconv>
#include <iostream>
#include <system_error>

namespace fetchkit {

static constexpr const char* kEventPrefix = "event:";
static constexpr const char* kIdPrefix    = "id:";
static constexpr const char* kRetryPrefix = "retry:";

// Longest excerpt of a payload quoted in a log line
static constexpr size_t kLogExcerpt = 100;

StreamProcessor::StreamProcessor(StreamProcessorConfig config)
    : config_(std::move(config)) {
    if (config_.separator.empty()) {
        std::cerr << "[stream] Empty separator is not allowed, using \"\\n\\n\"\n";
        config_.separator = "\n\n";
    }
}

std::string StreamProcessor::strip_prefix(const std::string& line, const std::string& prefix) {
    if (!starts_with(line, prefix)) return line;
    size_t len = prefix.size();
    if (line.size() > len && line[len] == ' ') ++len;
    return line.substr(len);
}

Frame StreamProcessor::parse_frame(const std::string& block, const StreamProcessorConfig& config) {
    Frame frame;
    std::string untransformed;

    for (const auto& raw_line : split(block, '\n')) {
        std::string line = trim(raw_line);

        if (starts_with(line, kEventPrefix)) {
            frame.event = trim(line.substr(std::char_traits<char>::length(kEventPrefix)));
            continue;
        }
        if (starts_with(line, kIdPrefix)) {
            frame.id = trim(line.substr(std::char_traits<char>::length(kIdPrefix)));
            continue;
        }
        if (starts_with(line, kRetryPrefix)) {
            std::string value = trim(line.substr(std::char_traits<char>::length(kRetryPrefix)));
            uint32_t ms = 0;
            const char* end = value.data() + value.size();
            auto [ptr, ec] = std::from_chars(value.data(), end, ms);
            if (ec == std::errc{} && ptr == end) {
                frame.retry = ms;
            } else {
                std::cerr << "[stream] Ignoring invalid retry field: \"" << value << "\"\n";
            }
            continue;
        }

        if (!starts_with(line, config.data_prefix) && config.ignore_invalid_prefix) continue;

        std::string part = trim(strip_prefix(line, config.data_prefix));
        untransformed += part;
        frame.payload += config.transform ? config.transform(part) : part;
    }

    frame.terminal = untransformed == config.done_signal;
    if (frame.terminal) frame.payload.clear();
    return frame;
}

std::vector<nlohmann::json> StreamProcessor::decode(const Frame& frame) {
    std::vector<nlohmann::json> values;
    if (!config_.parse_json || frame.payload.empty()) return values;

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(frame.payload);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[stream] JSON decode failed for \""
                  << frame.payload.substr(0, kLogExcerpt) << "\": " << e.what() << "\n";
        return values;
    }

    if (parsed.is_array()) {
        std::string inner = trim(frame.payload);
        inner = trim(inner.substr(1, inner.size() - 2));
        if (!inner.empty()) decoded_raw_.push_back(std::move(inner));
        for (auto& item : parsed) values.push_back(std::move(item));
    } else {
        decoded_raw_.push_back(trim(frame.payload));
        values.push_back(std::move(parsed));
    }

    // Metadata goes on objects only; scalars stay untouched
    for (auto& value : values) {
        if (!value.is_object()) continue;
        value[kEventKey] = frame.event.value_or("");
        if (frame.id) value[kIdKey] = *frame.id;
        if (frame.retry) value[kRetryKey] = *frame.retry;
    }
    return values;
}

void StreamProcessor::record(const std::string& payload, const std::vector<nlohmann::json>& values) {
    all_content_ += payload;
    all_json_.insert(all_json_.end(), values.begin(), values.end());
    if (config_.on_message) {
        StreamSnapshot s = snapshot(payload, values);
        if (!payload.empty()) s.current_frames.push_back(payload);
        config_.on_message(s);
    }
}

bool StreamProcessor::consume_block(const std::string& block, StreamSnapshot& current) {
    Frame frame = parse_frame(block, config_);
    if (frame.terminal) return true;

    auto values = decode(frame);
    if (frame.payload.empty() && values.empty()) return false;

    record(frame.payload, values);
    current.current_content += frame.payload;
    current.current_json.insert(current.current_json.end(), values.begin(), values.end());
    if (!frame.payload.empty()) current.current_frames.push_back(frame.payload);
    return false;
}

StreamSnapshot StreamProcessor::process_chunk(const std::string& chunk) {
    if (phase_ == StreamPhase::Completed || phase_ == StreamPhase::Aborted) {
        std::cerr << "[stream] Stream already ended, ignoring chunk\n";
        return snapshot({}, {});
    }
    phase_ = StreamPhase::Accumulating;

    if (!config_.parse_frames) return process_unframed(chunk);

    buffer_ += chunk;

    StreamSnapshot current;
    size_t pos;
    while ((pos = buffer_.find(config_.separator)) != std::string::npos) {
        std::string block = buffer_.substr(0, pos);
        buffer_.erase(0, pos + config_.separator.size());

        if (consume_block(block, current)) {
            // Nothing after the done signal is processed
            buffer_.clear();
            phase_ = StreamPhase::Completed;
            break;
        }
    }

    StreamSnapshot result = snapshot(std::move(current.current_content),
                                     std::move(current.current_json));
    result.current_frames = std::move(current.current_frames);
    return result;
}

StreamSnapshot StreamProcessor::process_unframed(const std::string& chunk) {
    std::string trimmed = trim(chunk);
    if (trimmed == config_.done_signal) {
        phase_ = StreamPhase::Completed;
        return snapshot({}, {});
    }

    std::vector<nlohmann::json> values;
    bool looks_like_json = trimmed.size() >= 2 &&
        ((trimmed.front() == '{' && trimmed.back() == '}') ||
         (trimmed.front() == '[' && trimmed.back() == ']'));
    if (config_.parse_json && looks_like_json) {
        Frame frame;
        frame.payload = trimmed;
        values = decode(frame);
    }

    if (!chunk.empty() || !values.empty()) record(chunk, values);
    StreamSnapshot result = snapshot(chunk, std::move(values));
    if (!chunk.empty()) result.current_frames.push_back(chunk);
    return result;
}

std::optional<StreamSnapshot> StreamProcessor::flush() {
    if (phase_ == StreamPhase::Completed || phase_ == StreamPhase::Aborted) return std::nullopt;
    if (trim(buffer_).empty()) {
        buffer_.clear();
        return std::nullopt;
    }

    std::string remainder;
    remainder.swap(buffer_);
    std::cerr << "[stream] Processing unterminated remainder: \""
              << remainder.substr(0, kLogExcerpt) << "\"\n";

    StreamSnapshot current;
    if (consume_block(remainder, current)) {
        phase_ = StreamPhase::Completed;
    }
    if (current.current_content.empty() && current.current_json.empty()) return std::nullopt;
    StreamSnapshot result = snapshot(std::move(current.current_content),
                                     std::move(current.current_json));
    result.current_frames = std::move(current.current_frames);
    return result;
}

void StreamProcessor::abort() {
    if (phase_ == StreamPhase::Completed) return;
    phase_ = StreamPhase::Aborted;
    buffer_.clear();
}

std::string StreamProcessor::decoded_json_array() const {
    std::string out = "[";
    for (size_t i = 0; i < decoded_raw_.size(); ++i) {
        if (i > 0) out += ',';
        out += decoded_raw_[i];
    }
    out += ']';
    return out;
}

StreamSnapshot StreamProcessor::snapshot(std::string current,
                                         std::vector<nlohmann::json> current_json) const {
    StreamSnapshot s;
    s.current_content = std::move(current);
    s.current_json = std::move(current_json);
    s.all_content = all_content_;
    s.all_json = all_json_;
    s.is_end = phase_ == StreamPhase::Completed;
    return s;
}

} // namespace fetchkit
