#include "util/ids.hpp"
#include <cstdint>
#include <mutex>
#include <random>

namespace helm::util {

std::string generate_id(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = engine();
    }

    static const char* hex = "0123456789abcdef";
    std::string id = prefix;
    id.reserve(prefix.size() + 16);
    for (int shift = 60; shift >= 0; shift -= 4) {
        id.push_back(hex[(value >> shift) & 0xF]);
    }
    return id;
}

} // namespace helm::util
