#pragma once
#include <exception>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "kernel/error.hpp"

namespace helm::kernel {

// Runs op and converts any unexpected exception into an INTERNAL
// KernelError. KernelErrors pass through unchanged.
template <typename Op>
auto with_recovery(const std::string& name, Op&& op) -> decltype(op()) {
    try {
        return std::forward<Op>(op)();
    } catch (const KernelError&) {
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Panic in {}: {}", name, e.what());
        throw internal_error("Panic in " + name + ": " + e.what());
    } catch (...) {
        spdlog::error("Panic in {}: unknown exception", name);
        throw internal_error("Panic in " + name + ": unknown exception");
    }
}

} // namespace helm::kernel
