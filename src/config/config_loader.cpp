#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace hoya::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "workerThreads", config.server.worker_threads);
    }

    if (data.contains("fetch") && data["fetch"].is_object()) {
        const auto& fetch = data["fetch"];
        ReadInt(fetch, "connectTimeoutS", config.fetch.connect_timeout_s);
        ReadInt(fetch, "readTimeoutS", config.fetch.read_timeout_s);
        ReadBool(fetch, "followRedirects", config.fetch.follow_redirects);
        ReadBool(fetch, "useProxy", config.fetch.use_proxy);
    }

    if (data.contains("download") && data["download"].is_object()) {
        ReadInt(data["download"], "timeoutS", config.download.timeout_s);
    }

    if (data.contains("engine") && data["engine"].is_object()) {
        const auto& engine = data["engine"];
        ReadInt(engine, "wasmStackBytes", config.engine.wasm_stack_bytes);
        ReadString(engine, "entryPoint", config.engine.entry_point);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.log.level);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void OverrideInt(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideBool(const char* primary, const char* secondary, bool& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void OverrideString(const char* primary, const char* secondary, std::string& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".hoya" / "config.json";
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        ApplyConfigFromJson(config, data);
    } catch (const nlohmann::json::exception& ex) {
        // Keep defaults on parse errors
        utils::Log(utils::LogLevel::kWarn, "config",
                   "ignoring " + path.string() + ": " + ex.what());
        return Config{};
    }
    return config;
}

void ApplyEnvOverrides(Config& config) {
    OverrideString("HOYA_SERVER__HOST", "HOYA_SERVER_HOST", config.server.host);
    OverrideInt("HOYA_SERVER__PORT", "HOYA_SERVER_PORT", config.server.port);
    OverrideInt("HOYA_SERVER__WORKER_THREADS", "HOYA_SERVER_WORKER_THREADS",
                config.server.worker_threads);

    OverrideInt("HOYA_FETCH__CONNECT_TIMEOUT_S", "HOYA_FETCH_CONNECT_TIMEOUT_S",
                config.fetch.connect_timeout_s);
    OverrideInt("HOYA_FETCH__READ_TIMEOUT_S", "HOYA_FETCH_READ_TIMEOUT_S",
                config.fetch.read_timeout_s);
    OverrideBool("HOYA_FETCH__FOLLOW_REDIRECTS", "HOYA_FETCH_FOLLOW_REDIRECTS",
                 config.fetch.follow_redirects);
    OverrideBool("HOYA_FETCH__USE_PROXY", "HOYA_FETCH_USE_PROXY", config.fetch.use_proxy);

    OverrideInt("HOYA_DOWNLOAD__TIMEOUT_S", "HOYA_DOWNLOAD_TIMEOUT_S", config.download.timeout_s);

    OverrideInt("HOYA_ENGINE__WASM_STACK_BYTES", "HOYA_ENGINE_WASM_STACK_BYTES",
                config.engine.wasm_stack_bytes);
    OverrideString("HOYA_ENGINE__ENTRY_POINT", "HOYA_ENGINE_ENTRY_POINT", config.engine.entry_point);

    OverrideString("HOYA_LOG__LEVEL", "HOYA_LOG_LEVEL", config.log.level);
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvOverrides(config);
    return config;
}

}  // namespace hoya::config
