#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace helm::ipc {

namespace {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace

SocketServer::SocketServer(const std::string& socket_path, uint32_t max_frame_bytes,
                           size_t max_connections)
    : socket_path_(socket_path),
      max_frame_bytes_(max_frame_bytes),
      max_connections_(max_connections) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::init() {
    struct sockaddr_un addr {};
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    // Remove a socket file left by a previous run
    unlink(socket_path_.c_str());

    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}: {}", socket_path_, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 128) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (!set_nonblocking(server_fd_)) {
        spdlog::error("Failed to make server socket non-blocking: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    spdlog::info("Socket server listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(FrameHandler handler) {
    handler_ = std::move(handler);
}

int SocketServer::accept_connection() {
    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept connection: {}", strerror(errno));
        }
        return -1;
    }

    if (clients_.size() >= max_connections_) {
        spdlog::warn("Connection limit ({}) reached, rejecting fd {}", max_connections_, client_fd);
        close(client_fd);
        return -1;
    }

    uint32_t client_id = next_client_id_++;
    clients_[client_fd] = std::make_unique<ClientConnection>(client_fd, client_id, max_frame_bytes_);
    spdlog::info("Client connected (fd={}, id={})", client_fd, client_id);
    return client_fd;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    auto& client = *it->second;

    uint8_t buf[8192];
    while (true) {
        ssize_t n = recv(client_fd, buf, sizeof(buf), 0);
        if (n > 0) {
            client.decoder.feed(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            spdlog::info("Client disconnected (fd={}, id={})", client_fd, client.client_id);
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        spdlog::error("recv failed on fd {}: {}", client_fd, strerror(errno));
        return false;
    }

    try {
        process_frames(client);
    } catch (const FrameError& e) {
        spdlog::warn("Dropping client {} after malformed frame: {}", client.client_id, e.what());
        return false;
    }
    return flush_client(client_fd);
}

void SocketServer::process_frames(ClientConnection& client) {
    while (auto frame = client.decoder.next()) {
        if (!handler_) {
            continue;
        }
        Frame reply = handler_(*frame);
        queue_frame(client, reply.type, reply.payload);
    }
}

void SocketServer::queue_frame(ClientConnection& client, MessageType type,
                               const std::vector<uint8_t>& payload) {
    auto bytes = encode_frame(type, payload, max_frame_bytes_);
    client.send_buffer.insert(client.send_buffer.end(), bytes.begin(), bytes.end());
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    auto& client = *it->second;

    while (!client.send_buffer.empty()) {
        ssize_t n = send(client_fd, client.send_buffer.data(), client.send_buffer.size(), MSG_NOSIGNAL);
        if (n > 0) {
            client.send_buffer.erase(client.send_buffer.begin(), client.send_buffer.begin() + n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        spdlog::error("send failed on fd {}: {}", client_fd, strerror(errno));
        return false;
    }
    return true;
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    return it != clients_.end() && !it->second->send_buffer.empty();
}

uint32_t SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return 0;
    }
    uint32_t client_id = it->second->client_id;
    close(client_fd);
    clients_.erase(it);
    spdlog::debug("Removed client (fd={}, id={})", client_fd, client_id);
    return client_id;
}

void SocketServer::stop() {
    for (auto& [fd, client] : clients_) {
        close(fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::info("Socket server stopped");
    }
}

} // namespace helm::ipc
