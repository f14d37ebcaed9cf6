#pragma once
#include <atomic>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>

namespace transpiler::core::config {

    // "inv-<pid>-<counter>-<8 hex>". The counter alone makes names unique inside
    // one process; pid separates servers sharing a temp root.
    inline std::string generate_invocation_id() {
        static std::atomic<std::uint64_t> counter{0};
        const std::uint64_t sequence = counter.fetch_add(1) + 1;

        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "inv-" << static_cast<long>(getpid()) << "-" << sequence << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace transpiler::core::config
