#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fetchkit {

// Keys attached to object-shaped decoded values from frame metadata lines
inline constexpr const char* kEventKey = "__internal__event";
inline constexpr const char* kIdKey    = "__internal__id";
inline constexpr const char* kRetryKey = "__internal__retry";

// One complete delimited unit of the wire format, before JSON decoding.
struct Frame {
    std::string payload;                // prefixed lines, concatenated
    std::optional<std::string> event;   // "event:" line
    std::optional<std::string> id;      // "id:" line
    std::optional<uint32_t> retry;      // "retry:" line, milliseconds
    bool terminal = false;              // payload equals the done signal
};

// Immutable view of the processor state handed to callbacks and callers.
// Every field is a copy; mutating it never affects the processor.
struct StreamSnapshot {
    std::string current_content;                  // raw payload of this frame/chunk
    std::vector<nlohmann::json> current_json;     // values decoded from it
    std::vector<std::string> current_frames;      // raw payload of each frame, in order
    std::string all_content;                      // every raw payload so far
    std::vector<nlohmann::json> all_json;         // every decoded value so far
    bool is_end = false;
};

using MessageCallback = std::function<void(const StreamSnapshot&)>;

struct StreamProcessorConfig {
    bool parse_frames = true;          // strip SSE framing; false = chunk is payload
    bool parse_json = true;            // decode payloads as JSON
    bool ignore_invalid_prefix = true; // skip lines without data_prefix
    std::string separator = "\n\n";
    std::string data_prefix = "data:";
    std::string done_signal = "[DONE]";
    // Applied to every payload line before concatenation
    std::function<std::string(const std::string&)> transform;
    // Fired synchronously for every frame carrying content
    MessageCallback on_message;
};

enum class StreamPhase { Idle, Accumulating, Completed, Aborted };

// Incremental SSE-style stream processor. Feed chunks as they arrive; frames
// split across chunk boundaries are reassembled in an internal buffer.
class StreamProcessor {
public:
    explicit StreamProcessor(StreamProcessorConfig config = {});

    // Feed a chunk. Returns the content extracted from this chunk plus the
    // accumulated state. After the done signal every call is a no-op.
    StreamSnapshot process_chunk(const std::string& chunk);

    // Best-effort processing of an unterminated remainder once the stream
    // has ended. Returns nullopt if nothing usable was left.
    std::optional<StreamSnapshot> flush();

    // Stop accepting input (consumer gave up on the stream)
    void abort();

    // All successfully decoded payloads as one JSON array string, built
    // from their original text.
    std::string decoded_json_array() const;

    StreamPhase phase() const { return phase_; }
    bool is_end() const { return phase_ == StreamPhase::Completed; }
    const std::string& all_content() const { return all_content_; }
    const std::vector<nlohmann::json>& all_json() const { return all_json_; }
    const StreamProcessorConfig& config() const { return config_; }

    // Split one frame block into payload and metadata
    static Frame parse_frame(const std::string& block, const StreamProcessorConfig& config);

    // Remove `prefix` and one following space from `line`; lines without
    // the prefix are returned unchanged.
    static std::string strip_prefix(const std::string& line, const std::string& prefix);

private:
    StreamSnapshot process_unframed(const std::string& chunk);
    bool consume_block(const std::string& block, StreamSnapshot& current);
    std::vector<nlohmann::json> decode(const Frame& frame);
    void record(const std::string& payload, const std::vector<nlohmann::json>& values);
    StreamSnapshot snapshot(std::string current, std::vector<nlohmann::json> current_json) const;

    StreamProcessorConfig config_;
    StreamPhase phase_ = StreamPhase::Idle;
    std::string buffer_;
    std::string all_content_;
    std::vector<nlohmann::json> all_json_;
    std::vector<std::string> decoded_raw_;
};

} // namespace fetchkit
