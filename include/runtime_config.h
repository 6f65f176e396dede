#pragma once

#include <cstddef>
#include <string>

#include "command_loop.h"
#include "logger.h"

namespace poolq::core {

// 面向应用层的运行时配置快照（来源：YAML 配置文件 + 环境变量覆盖）。
struct RuntimeConfig {
    std::string config_path;
    LogLevel log_level{LogLevel::Info};
    std::string log_prefix;
    std::size_t pool_capacity{2};
    std::size_t queue_capacity{2};  // 未显式配置时跟随 pool_capacity（含环境变量覆盖后的值）
    bool auto_close{true};      // command loop 退出时是否关闭 queue 与命令源
    std::size_t chunk_bytes{16};
    bool metrics_enable{false};
};

// 读取进程配置。
RuntimeConfig runtime_config();

// 重新加载指定配置文件并返回快照；文件缺失或解析失败时返回默认值快照。
RuntimeConfig reload_runtime_config(const std::string& path);

// 由配置生成 CommandLoop 选项（auto_close 取自 command_loop.auto_close）。
CommandLoopOptions command_loop_options(const RuntimeConfig& cfg, std::string name = "command_loop");

// 把日志相关配置应用到进程 logger。
void apply_logging_config(const RuntimeConfig& cfg, Logger& logger = Logger::getInstance());

} // namespace poolq::core
