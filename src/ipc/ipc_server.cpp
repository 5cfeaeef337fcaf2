#include "ipc/ipc_server.hpp"
#include "ipc/handlers.hpp"
#include "ipc/socket_server.hpp"
#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

namespace helm::ipc {

namespace interest = kernel::interest;

namespace {

// The one server the signal handlers stop
IpcServer* g_server = nullptr;

void on_shutdown_signal(int /*sig*/) {
    if (g_server) {
        g_server->shutdown();
    }
}

} // namespace

IpcServer::IpcServer(kernel::KernelContext& context)
    : context_(context),
      reactor_(std::make_unique<kernel::Reactor>()),
      socket_server_(std::make_unique<SocketServer>(
          context.config.ipc.socket_path,
          context.config.ipc.max_frame_bytes,
          context.config.ipc.max_connections)) {
    register_all(router_, context_, modules_);
}

IpcServer::~IpcServer() {
    if (g_server == this) {
        g_server = nullptr;
    }
}

bool IpcServer::init() {
    if (!reactor_->init()) {
        return false;
    }

    socket_server_->set_handler([this](const Frame& frame) {
        return router_.handle(frame);
    });
    if (!socket_server_->init()) {
        return false;
    }

    bool watching = reactor_->watch(socket_server_->get_server_fd(), interest::IN,
        [this](int fd, uint32_t fired) { on_server_event(fd, fired); });
    if (!watching) {
        return false;
    }

    g_server = this;
    std::signal(SIGINT, on_shutdown_signal);
    std::signal(SIGTERM, on_shutdown_signal);
    std::signal(SIGPIPE, SIG_IGN);

    spdlog::info("Serving {} methods from {} services",
        router_.methods().size(), modules_.size());
    return true;
}

void IpcServer::run() {
    spdlog::info("helmd listening on {}", socket_server_->socket_path());
    reactor_->run();

    spdlog::info("Closing {} client connection(s)", socket_server_->client_count());
    socket_server_->stop();
}

void IpcServer::shutdown() {
    reactor_->stop();
}

void IpcServer::on_server_event(int /*fd*/, uint32_t fired) {
    if (!(fired & interest::IN)) {
        return;
    }
    // Drain the accept backlog
    for (int client_fd = socket_server_->accept_connection(); client_fd >= 0;
         client_fd = socket_server_->accept_connection()) {
        bool watching = reactor_->watch(client_fd, interest::CLIENT,
            [this](int cfd, uint32_t ev) { on_client_event(cfd, ev); });
        if (!watching) {
            socket_server_->remove_client(client_fd);
        }
    }
}

void IpcServer::on_client_event(int fd, uint32_t fired) {
    bool alive = true;
    if (fired & interest::IN) {
        alive = socket_server_->handle_client(fd);
    }
    if (alive && (fired & (interest::ERR | interest::HUP))) {
        alive = false;
    }
    if (alive && (fired & interest::OUT)) {
        alive = socket_server_->flush_client(fd);
    }

    if (!alive) {
        drop_client(fd);
        return;
    }
    update_client_events(fd);
}

void IpcServer::update_client_events(int fd) {
    uint32_t mask = interest::CLIENT;
    if (socket_server_->client_wants_write(fd)) {
        mask |= interest::OUT;
    }
    if (!reactor_->rearm(fd, mask)) {
        drop_client(fd);
    }
}

void IpcServer::drop_client(int fd) {
    reactor_->unwatch(fd);
    socket_server_->remove_client(fd);
}

} // namespace helm::ipc
