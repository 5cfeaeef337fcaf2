#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ipc/protocol.hpp"

namespace helm::ipc {

// Client connection state
struct ClientConnection {
    int fd;
    uint32_t client_id;
    FrameDecoder decoder;
    std::vector<uint8_t> send_buffer;

    ClientConnection(int fd, uint32_t id, uint32_t max_frame_bytes)
        : fd(fd), client_id(id), decoder(max_frame_bytes) {}
};

// One request frame in, one reply frame out
using FrameHandler = std::function<Frame(const Frame&)>;

class SocketServer {
public:
    SocketServer(const std::string& socket_path, uint32_t max_frame_bytes, size_t max_connections);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Bind and listen on the unix socket, replacing a stale socket file
    bool init();

    void set_handler(FrameHandler handler);

    int get_server_fd() const { return server_fd_; }

    // Returns the client fd, or -1 when nothing is pending or the
    // connection limit is reached
    int accept_connection();

    // Reads, dispatches complete frames and queues replies.
    // Returns false when the client disconnected or sent a malformed frame.
    bool handle_client(int client_fd);

    // Returns false on a write error
    bool flush_client(int client_fd);

    bool client_wants_write(int client_fd) const;

    // Returns the client id, 0 when unknown
    uint32_t remove_client(int client_fd);

    size_t client_count() const { return clients_.size(); }

    void stop();

    const std::string& socket_path() const { return socket_path_; }

private:
    std::string socket_path_;
    uint32_t max_frame_bytes_;
    size_t max_connections_;
    int server_fd_ = -1;
    uint32_t next_client_id_ = 1;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;
    FrameHandler handler_;

    void process_frames(ClientConnection& client);
    void queue_frame(ClientConnection& client, MessageType type, const std::vector<uint8_t>& payload);
};

} // namespace helm::ipc
