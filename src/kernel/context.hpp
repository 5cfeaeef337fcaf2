#pragma once

#include "kernel/config.hpp"

namespace helm::kernel {

class Kernel;
class CleanupService;

// What service modules may reach; owned by the daemon
struct KernelContext {
    const KernelConfig& config;
    Kernel& kernel;
    CleanupService* cleanup = nullptr;  // null when reclamation is disabled
};

} // namespace helm::kernel
