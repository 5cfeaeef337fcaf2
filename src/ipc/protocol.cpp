#include "ipc/protocol.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace helm::ipc {

namespace {

uint32_t decode_length(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

void check_length(uint32_t length, uint32_t max_frame_bytes) {
    if (length == 0) {
        throw FrameError("frame too short");
    }
    if (length > max_frame_bytes) {
        throw FrameError("frame of " + std::to_string(length) +
                         " bytes exceeds maximum of " + std::to_string(max_frame_bytes));
    }
}

MessageType check_type(uint8_t value) {
    if (!is_valid_message_type(value)) {
        throw FrameError("unknown message type " + std::to_string(value));
    }
    return static_cast<MessageType>(value);
}

// Reads exactly len bytes; returns the number read before EOF
size_t read_fully(int fd, uint8_t* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::read(fd, buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw FrameError(std::string("read failed: ") + strerror(errno));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

void write_fully(int fd, const uint8_t* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::write(fd, buf + total, len - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw FrameError(std::string("write failed: ") + strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
}

} // namespace

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::REQUEST:      return "REQUEST";
        case MessageType::RESPONSE:     return "RESPONSE";
        case MessageType::STREAM_CHUNK: return "STREAM_CHUNK";
        case MessageType::STREAM_END:   return "STREAM_END";
        case MessageType::ERROR:        return "ERROR";
    }
    return "UNKNOWN";
}

bool is_valid_message_type(uint8_t value) {
    switch (value) {
        case 0x01: case 0x02: case 0x03: case 0x04: case 0xFF:
            return true;
        default:
            return false;
    }
}

std::vector<uint8_t> encode_frame(MessageType type, const std::vector<uint8_t>& payload,
                                  uint32_t max_frame_bytes) {
    if (payload.size() + 1 > max_frame_bytes) {
        throw FrameError("payload of " + std::to_string(payload.size()) +
                         " bytes exceeds maximum frame size of " + std::to_string(max_frame_bytes));
    }
    auto length = static_cast<uint32_t>(payload.size() + 1);

    std::vector<uint8_t> out;
    out.reserve(FRAME_HEADER_SIZE + length);
    out.push_back(static_cast<uint8_t>(length >> 24));
    out.push_back(static_cast<uint8_t>(length >> 16));
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length));
    out.push_back(static_cast<uint8_t>(type));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

void write_frame(int fd, MessageType type, const std::vector<uint8_t>& payload,
                 uint32_t max_frame_bytes) {
    auto bytes = encode_frame(type, payload, max_frame_bytes);
    write_fully(fd, bytes.data(), bytes.size());
}

std::optional<Frame> read_frame(int fd, uint32_t max_frame_bytes) {
    uint8_t header[FRAME_HEADER_SIZE];
    size_t got = read_fully(fd, header, FRAME_HEADER_SIZE);
    if (got == 0) {
        return std::nullopt;
    }
    if (got < FRAME_HEADER_SIZE) {
        throw FrameError("unexpected end of stream in frame header");
    }

    uint32_t length = decode_length(header);
    check_length(length, max_frame_bytes);

    std::vector<uint8_t> body(length);
    if (read_fully(fd, body.data(), length) < length) {
        throw FrameError("unexpected end of stream in frame body");
    }

    Frame frame;
    frame.type = check_type(body[0]);
    frame.payload.assign(body.begin() + 1, body.end());
    return frame;
}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<Frame> FrameDecoder::next() {
    if (buffer_.size() < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }

    uint32_t length = decode_length(buffer_.data());
    check_length(length, max_frame_bytes_);

    if (buffer_.size() < FRAME_HEADER_SIZE + length) {
        return std::nullopt;
    }

    Frame frame;
    frame.type = check_type(buffer_[FRAME_HEADER_SIZE]);
    frame.payload.assign(buffer_.begin() + FRAME_HEADER_SIZE + 1,
                         buffer_.begin() + FRAME_HEADER_SIZE + length);
    buffer_.erase(buffer_.begin(), buffer_.begin() + FRAME_HEADER_SIZE + length);
    return frame;
}

} // namespace helm::ipc
