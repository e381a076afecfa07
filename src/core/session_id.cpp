#include "session_id.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <fmt/format.h>
#include <unistd.h>

std::string generate_session_id() {
    // Random per-process prefix + counter: unique within the process,
    // and unlikely to repeat across processes sharing a host.
    static const uint32_t process_tag = [] {
        std::seed_seq seed{
            static_cast<uint32_t>(std::random_device{}()),
            static_cast<uint32_t>(getpid()),
            static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count())};
        std::mt19937 rng(seed);
        return static_cast<uint32_t>(rng());
    }();
    static std::atomic<uint32_t> counter{0};

    return fmt::format("{:08x}{:08x}", process_tag, counter.fetch_add(1));
}
