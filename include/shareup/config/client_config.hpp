#pragma once

#include "shareup/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace shareup::config {

/**
 * @brief Settings for the upload client
 *
 * JSON layout:
 * {
 *   "shares": { "photos": "/srv/shares/photos" },
 *   "worker_threads": 2,
 *   "chunk_size": 63488,
 *   "temporary_suffix": ".upload",
 *   "log_level": "info"
 * }
 * Every key is optional. An empty temporary_suffix disables staging.
 */
struct ClientConfig {
    std::map<std::string, std::filesystem::path> shares;
    std::size_t worker_threads = 2;
    std::size_t chunk_size = 63488;
    std::string temporary_suffix = ".upload";
    std::string log_level = "info";
};

Result<ClientConfig> parse_config(const std::string& text);
Result<ClientConfig> load_config(const std::filesystem::path& path);

/// Sets the global spdlog level from config.log_level
void apply_log_level(const ClientConfig& config);

} // namespace shareup::config
