#include "internal/config.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

#include "logger.h"

namespace poolq {

namespace {

// 读取正整数容量；缺失、非法或 <= 0 时保留原值。
std::size_t read_capacity(const YAML::Node& n, std::size_t current, const char* key) {
    if (!n) return current;
    const long long v = n.as<long long>(0);
    if (v <= 0) {
        core::Logger::getInstance().log(core::LogLevel::Warn, "config: ignoring non-positive capacity",
                                        {{"key", key}, {"value", n.Scalar()}});
        return current;
    }
    return static_cast<std::size_t>(v);
}

bool parse_env_capacity(const char* s, std::size_t& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0' || v <= 0) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    const char* override_path = std::getenv("POOLQ_CONFIG_PATH");
    const std::string cfg_path = (override_path && *override_path) ? std::string(override_path)
                                                                   : std::string("config/poolq_config.yaml");
    loadFromFile(cfg_path);
}

bool Config::loadFromFile(const std::string& path) {
    settings_ = Settings{};

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path cfg_p(path);
    // 归一化为绝对路径，保证相对路径解析的一致性。
    const fs::path abs_cfg_p = fs::absolute(cfg_p, ec);
    if (!ec) cfg_p = abs_cfg_p;
    config_path_ = cfg_p.string();
    config_dir_ = cfg_p.parent_path().string();

    bool loaded = false;
    try {
        YAML::Node doc = YAML::LoadFile(config_path_);

        // logging:
        //   level: info
        //   prefix: "[poolq] "
        if (doc && doc["logging"]) {
            auto l = doc["logging"];
            if (l["level"]) settings_.log_level = l["level"].as<std::string>(settings_.log_level);
            if (l["prefix"]) settings_.log_prefix = l["prefix"].as<std::string>(settings_.log_prefix);
        }

        // pool_queue:
        //   pool_capacity: 2
        //   queue_capacity: 2   # 省略时与 pool_capacity 相同（在环境变量覆盖之后决定）
        if (doc && doc["pool_queue"]) {
            auto pq = doc["pool_queue"];
            settings_.pool_capacity = read_capacity(pq["pool_capacity"], settings_.pool_capacity, "pool_capacity");
            settings_.queue_capacity = read_capacity(pq["queue_capacity"], settings_.queue_capacity, "queue_capacity");
        }

        if (doc && doc["command_loop"]) {
            if (doc["command_loop"]["auto_close"]) {
                settings_.command_loop_auto_close =
                    doc["command_loop"]["auto_close"].as<bool>(settings_.command_loop_auto_close);
            }
        }

        if (doc && doc["hexdump"]) {
            settings_.hexdump_chunk_bytes =
                read_capacity(doc["hexdump"]["chunk_bytes"], settings_.hexdump_chunk_bytes, "chunk_bytes");
        }

        if (doc && doc["metrics"]) {
            if (doc["metrics"]["enable"]) {
                settings_.metrics_enable = doc["metrics"]["enable"].as<bool>(settings_.metrics_enable);
            }
        }
        loaded = true;
    } catch (const YAML::BadFile&) {
        core::Logger::getInstance().log(core::LogLevel::Debug, "config: file not found, using defaults",
                                        {{"path", config_path_}});
    } catch (const YAML::Exception& e) {
        settings_ = Settings{};
        core::Logger::getInstance().log(core::LogLevel::Warn, "config: parse error, using defaults",
                                        {{"path", config_path_}, {"err", e.what()}});
    }

    applyEnvOverrides();
    resolveDefaults();
    return loaded;
}

// 环境变量覆盖（用于快速联调）
void Config::applyEnvOverrides() {
    if (const char* lv = std::getenv("POOLQ_LOG_LEVEL"); lv && *lv) {
        settings_.log_level = lv;
    }
    std::size_t v = 0;
    if (parse_env_capacity(std::getenv("POOLQ_POOL_CAPACITY"), v)) {
        settings_.pool_capacity = v;
    }
    if (parse_env_capacity(std::getenv("POOLQ_QUEUE_CAPACITY"), v)) {
        settings_.queue_capacity = v;
    }
}

// 依赖其他键的默认值在全部覆盖完成后再确定。
void Config::resolveDefaults() {
    if (settings_.queue_capacity == 0) {
        settings_.queue_capacity = settings_.pool_capacity;
    }
}

} // namespace poolq
