#pragma once
#include <random>
#include <sstream>
#include <string>

namespace sqlbridge::core::config {

    // Generates an 8-character hex suffix, e.g. "sqlbridge-config-1f3a9c0d"
    inline std::string generate_artifact_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace sqlbridge::core::config
