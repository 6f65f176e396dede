#pragma once

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace poolq::core {

enum class LogLevel : int { Error = 0, Warn = 1, Info = 2, Debug = 3 };

LogLevel parse_log_level(std::string_view s, LogLevel def = LogLevel::Info);
const char* log_level_tag(LogLevel l);

// 轻量日志组件。
//
// 输出格式（单行）：
//   <prefix><tag> <message> key=value ...
//
// - prefix：用户提供的前缀（例如 "[poolq_hexdump] "）
// - tag： [ERR]/[WRN]/[INF]/[DBG] 之一
// - fields：可选的 key/value 字段
//
// 默认输出到 stdout（Error 输出到 stderr）；设置 sink 后改为交给 sink，
// 便于把 logger 作为依赖注入到后台循环中并在测试里捕获输出。
class Logger {
public:
    using Field = std::pair<std::string_view, std::string_view>;
    // 接收已格式化的整行（不含换行符）。
    using Sink = std::function<void(LogLevel, const std::string&)>;

    Logger() = default;
    Logger(LogLevel level, std::string prefix);
    Logger(LogLevel level, std::string prefix, Sink sink);

    static Logger& getInstance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_prefix(std::string prefix);
    const std::string& prefix() const;

    void set_sink(Sink sink);

    void log(LogLevel l, std::string_view msg) const;
    void log(LogLevel l, std::string_view msg, std::initializer_list<Field> fields) const;

    void error(std::string_view msg) const { log(LogLevel::Error, msg); }
    void warn(std::string_view msg) const { log(LogLevel::Warn, msg); }
    void info(std::string_view msg) const { log(LogLevel::Info, msg); }
    void debug(std::string_view msg) const { log(LogLevel::Debug, msg); }

private:
    LogLevel level_{LogLevel::Info};
    std::string prefix_;
    Sink sink_;
};

}  // namespace poolq::core
