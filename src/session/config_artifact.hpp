#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace sqlbridge::session {

// Temporary JSON file handed to the server. Removed when the owner goes away,
// whatever path teardown took.
class ConfigArtifact {
public:
    static core::errors::Result<ConfigArtifact> write(
        const std::filesystem::path& directory, const nlohmann::json& payload);

    ConfigArtifact(ConfigArtifact&& other) noexcept;
    ConfigArtifact& operator=(ConfigArtifact&& other) noexcept;
    ConfigArtifact(const ConfigArtifact&) = delete;
    ConfigArtifact& operator=(const ConfigArtifact&) = delete;
    ~ConfigArtifact();

    const std::filesystem::path& path() const { return path_; }

    // Deletes the file now. Safe to call more than once.
    void remove();

private:
    explicit ConfigArtifact(std::filesystem::path path);

    std::filesystem::path path_;
};

}  // namespace sqlbridge::session
