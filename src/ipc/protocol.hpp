#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace helm::ipc {

// Wire format: [length:4 BE][type:1][payload:length-1]
// length counts the type byte plus the payload.
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;

enum class MessageType : uint8_t {
    REQUEST      = 0x01,
    RESPONSE     = 0x02,
    STREAM_CHUNK = 0x03,
    STREAM_END   = 0x04,
    ERROR        = 0xFF
};

const char* message_type_to_string(MessageType type);
bool is_valid_message_type(uint8_t value);

struct Frame {
    MessageType type = MessageType::REQUEST;
    std::vector<uint8_t> payload;

    Frame() = default;
    Frame(MessageType t, std::vector<uint8_t> p) : type(t), payload(std::move(p)) {}

    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }
};

class FrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throws FrameError when the frame would exceed max_frame_bytes
std::vector<uint8_t> encode_frame(MessageType type, const std::vector<uint8_t>& payload,
                                  uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);

// Blocking fd I/O. read_frame returns nullopt on a clean EOF before any
// header byte; truncation, a zero length, an oversized length or an
// unknown type throw FrameError.
void write_frame(int fd, MessageType type, const std::vector<uint8_t>& payload,
                 uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);
std::optional<Frame> read_frame(int fd, uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);

// Incremental decoder for the non-blocking server path
class FrameDecoder {
public:
    explicit FrameDecoder(uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    void feed(const uint8_t* data, size_t len);

    // Next complete frame, nullopt when more bytes are needed.
    // Throws FrameError on a malformed header.
    std::optional<Frame> next();

    size_t buffered() const { return buffer_.size(); }

private:
    uint32_t max_frame_bytes_;
    std::vector<uint8_t> buffer_;
};

} // namespace helm::ipc
