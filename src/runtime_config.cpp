#include "runtime_config.h"

#include <utility>

#include "internal/config.h"

namespace poolq::core {

namespace {
RuntimeConfig snapshot(const Config& c) {
    RuntimeConfig cfg;
    cfg.config_path = c.getConfigPath();
    cfg.log_level = parse_log_level(c.getLogLevel(), LogLevel::Info);
    cfg.log_prefix = c.getLogPrefix();
    cfg.pool_capacity = c.getPoolCapacity();
    cfg.queue_capacity = c.getQueueCapacity();
    cfg.auto_close = c.getCommandLoopAutoClose();
    cfg.chunk_bytes = c.getHexdumpChunkBytes();
    cfg.metrics_enable = c.isMetricsEnabled();
    return cfg;
}
} // namespace

RuntimeConfig runtime_config() {
    return snapshot(Config::getInstance());
}

RuntimeConfig reload_runtime_config(const std::string& path) {
    Config& c = Config::getInstance();
    if (!c.loadFromFile(path)) {
        Logger::getInstance().log(LogLevel::Debug, "runtime config: defaults in effect", {{"path", path}});
    }
    return snapshot(c);
}

CommandLoopOptions command_loop_options(const RuntimeConfig& cfg, std::string name) {
    CommandLoopOptions opts;
    opts.name = std::move(name);
    opts.auto_close = cfg.auto_close;
    return opts;
}

void apply_logging_config(const RuntimeConfig& cfg, Logger& logger) {
    logger.set_level(cfg.log_level);
    logger.set_prefix(cfg.log_prefix);
}

} // namespace poolq::core
