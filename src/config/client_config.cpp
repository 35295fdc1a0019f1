#include "shareup/config/client_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace shareup::config {
namespace {

using json = nlohmann::json;

bool is_known_level(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

} // namespace

Result<ClientConfig> parse_config(const std::string& text) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return Err<ClientConfig>(std::string("Invalid JSON in config"));
    }
    if (!payload.is_object()) {
        return Err<ClientConfig>(std::string("Config must be a JSON object"));
    }

    ClientConfig config;
    try {
        if (payload.contains("shares")) {
            const auto& shares = payload.at("shares");
            if (!shares.is_object()) {
                return Err<ClientConfig>(std::string("'shares' must map volume names to directories"));
            }
            for (const auto& [volume, root] : shares.items()) {
                if (volume.empty() || !root.is_string()) {
                    return Err<ClientConfig>(std::string("Invalid share entry: '") + volume + "'");
                }
                config.shares[volume] = std::filesystem::path(root.get<std::string>());
            }
        }
        // Negative integers would wrap when read as size_t
        for (const char* key : {"worker_threads", "chunk_size"}) {
            if (payload.contains(key) && !payload.at(key).is_number_unsigned()) {
                return Err<ClientConfig>(std::string("'") + key + "' must be a non-negative integer");
            }
        }
        config.worker_threads = payload.value("worker_threads", config.worker_threads);
        config.chunk_size = payload.value("chunk_size", config.chunk_size);
        config.temporary_suffix = payload.value("temporary_suffix", config.temporary_suffix);
        config.log_level = payload.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Err<ClientConfig>(std::string("Invalid config value: ") + e.what());
    }

    if (config.chunk_size == 0) {
        return Err<ClientConfig>(std::string("chunk_size must be > 0"));
    }
    if (config.worker_threads == 0) {
        return Err<ClientConfig>(std::string("worker_threads must be > 0"));
    }
    if (!is_known_level(config.log_level)) {
        return Err<ClientConfig>(std::string("Unknown log level: ") + config.log_level);
    }
    return Ok(std::move(config));
}

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<ClientConfig>(std::string("Cannot open config file: ") + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return parse_config(contents.str());
}

void apply_log_level(const ClientConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

} // namespace shareup::config
