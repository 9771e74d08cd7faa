#pragma once
#include <random>
#include <sstream>
#include <string>

namespace toolguard::core::config {

    // 8-character hex ID prefixed with "call-", used to correlate the log
    // lines of one execute() call.
    inline std::string generate_call_id() {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "call-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace toolguard::core::config
