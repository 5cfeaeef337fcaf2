#pragma once
#include <memory>
#include <vector>
#include "ipc/router.hpp"
#include "kernel/context.hpp"

namespace helm::kernel {
class Reactor;
}

namespace helm::ipc {

class SocketServer;

// Serves the kernel over a unix socket: one reactor thread for all
// connections, every request dispatched through the Router.
class IpcServer {
public:
    explicit IpcServer(kernel::KernelContext& context);
    ~IpcServer();

    // Non-copyable
    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    // Sets up the reactor, socket and SIGINT/SIGTERM handlers
    bool init();

    // Blocks until shutdown() or a signal
    void run();

    void shutdown();

    Router& router() { return router_; }

private:
    kernel::KernelContext& context_;
    std::unique_ptr<kernel::Reactor> reactor_;
    std::unique_ptr<SocketServer> socket_server_;
    Router router_;
    std::vector<std::unique_ptr<ServiceModule>> modules_;

    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);
    void update_client_events(int fd);
    void drop_client(int fd);
};

} // namespace helm::ipc
