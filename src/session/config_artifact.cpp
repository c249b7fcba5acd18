#include "session/config_artifact.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/config/artifact_id.hpp"
#include "core/logging/logger.hpp"

namespace sqlbridge::session {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

core::errors::Result<ConfigArtifact> ConfigArtifact::write(
    const std::filesystem::path& directory, const nlohmann::json& payload) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to create artifact directory: " + directory.string(),
                           "artifact_dir_create_failed"};
    }

    std::string text;
    try {
        text = payload.dump(2) + "\n";
    } catch (const nlohmann::json::type_error& e) {
        return BridgeError{ErrorCategory::Input,
                           "Config payload cannot be encoded: " + std::string(e.what()),
                           "unencodable_config"};
    }

    const auto path =
        directory / (core::config::generate_artifact_id("sqlbridge-config") + ".json");
    // Credentials live in this file: owner-only from creation, never through a link.
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                        S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return BridgeError{ErrorCategory::Internal,
                           "Unable to open config artifact: " + path.string() + ": " +
                               std::strerror(errno),
                           "artifact_open_failed"};
    }

    std::size_t written = 0;
    int write_errno = 0;
    while (written < text.size()) {
        const ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        write_errno = n < 0 ? errno : EIO;
        break;
    }
    if (::close(fd) != 0 && write_errno == 0) {
        write_errno = errno;
    }
    if (write_errno != 0) {
        std::filesystem::remove(path, ec);
        return BridgeError{ErrorCategory::Internal,
                           "Unable to write config artifact: " + path.string() + ": " +
                               std::strerror(write_errno),
                           "artifact_write_failed"};
    }

    LOG_INFO("Created temporary config file: " + path.string());
    return ConfigArtifact(path);
}

ConfigArtifact::ConfigArtifact(std::filesystem::path path) : path_(std::move(path)) {}

ConfigArtifact::ConfigArtifact(ConfigArtifact&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ConfigArtifact& ConfigArtifact::operator=(ConfigArtifact&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ConfigArtifact::~ConfigArtifact() {
    remove();
}

void ConfigArtifact::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        LOG_INFO("Removed temporary config file: " + path_.string());
    } else if (ec) {
        LOG_WARN("Error removing config file " + path_.string() + ": " + ec.message());
    }
    path_.clear();
}

}  // namespace sqlbridge::session
