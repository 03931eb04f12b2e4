#include "hsync/core/id.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace hsync::core {
namespace {

std::mt19937_64& generator() {
    static std::mt19937_64 engine = [] {
        std::random_device device;
        std::seed_seq seed{device(), device(), device(), device(), device(), device()};
        return std::mt19937_64(seed);
    }();
    return engine;
}

} // namespace

std::string generate_id() {
    static std::mutex mutex;
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard lock(mutex);
        high = generator()();
        low = generator()();
    }

    // RFC 4122 version 4, variant 1
    high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<std::uint32_t>(high >> 32) << '-'
        << std::setw(4) << static_cast<std::uint32_t>((high >> 16) & 0xffff) << '-'
        << std::setw(4) << static_cast<std::uint32_t>(high & 0xffff) << '-'
        << std::setw(4) << static_cast<std::uint32_t>(low >> 48) << '-'
        << std::setw(12) << (low & 0xffffffffffffULL);
    return oss.str();
}

} // namespace hsync::core
