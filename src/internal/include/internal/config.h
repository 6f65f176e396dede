#ifndef POOLQ_CONFIG_H
#define POOLQ_CONFIG_H

#include <cstddef>
#include <string>

namespace poolq {
inline constexpr const char* kPoolqVersion = "0.3.0";

// 配置（单例）
// 读取顺序：默认值 < YAML 文件（POOLQ_CONFIG_PATH 或 config/poolq_config.yaml）< 环境变量。
class Config {
public:
    static Config& getInstance();

    // 重新读取指定 YAML 文件（先恢复默认值，再应用文件与环境变量覆盖）。
    // 文件缺失或解析失败时返回 false，保留默认值。
    bool loadFromFile(const std::string& path);

    // 解析后的绝对路径及其所在目录。
    const std::string& getConfigPath() const { return config_path_; }
    const std::string& getConfigDir() const { return config_dir_; }

    // 日志
    const std::string& getLogLevel() const { return settings_.log_level; }
    const std::string& getLogPrefix() const { return settings_.log_prefix; }

    // pool / queue 容量
    std::size_t getPoolCapacity() const { return settings_.pool_capacity; }
    std::size_t getQueueCapacity() const { return settings_.queue_capacity; }

    // command loop
    bool getCommandLoopAutoClose() const { return settings_.command_loop_auto_close; }

    // hexdump 工具
    std::size_t getHexdumpChunkBytes() const { return settings_.hexdump_chunk_bytes; }

    // 可观测性（可选）
    bool isMetricsEnabled() const { return settings_.metrics_enable; }

private:
    Config();
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void applyEnvOverrides();
    void resolveDefaults();

    struct Settings {
        std::string log_level{"info"};
        std::string log_prefix{};
        std::size_t pool_capacity{2};
        std::size_t queue_capacity{0};  // 0：未配置，跟随 pool_capacity
        bool command_loop_auto_close{true};
        std::size_t hexdump_chunk_bytes{16};
        bool metrics_enable{false};
    };

    std::string config_path_{};
    std::string config_dir_{};
    Settings settings_{};
};

} // namespace poolq

#endif // POOLQ_CONFIG_H
