#pragma once
#include <string>
#include <random>
#include <sstream>

namespace hostlink::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "host-1f3a9c0e"
    inline std::string generate_session_id(const std::string& prefix = "session") {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace hostlink::core::config
