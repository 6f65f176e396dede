#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "hexdump.h"
#include "logger.h"
#include "metrics_text.h"
#include "observability.h"
#include "runtime_config.h"

namespace {

struct Options {
    std::vector<std::string> files;
    poolq::core::HexdumpOptions hex;
    bool help{false};
};

std::size_t parse_positive(const char* s, std::size_t def) {
    const long long v = std::atoll(s);
    return v > 0 ? static_cast<std::size_t>(v) : def;
}

Options ParseArgs(int argc, char** argv, const poolq::core::RuntimeConfig& cfg) {
    Options opt;
    opt.hex.chunk_bytes = cfg.chunk_bytes;
    opt.hex.pool_slots = cfg.pool_capacity;
    opt.hex.queue_slots = cfg.queue_capacity;
    opt.hex.loop = poolq::core::command_loop_options(cfg, "hexdump_files");
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-c" || a == "--chunk") && i + 1 < argc)
            opt.hex.chunk_bytes = parse_positive(argv[++i], opt.hex.chunk_bytes);
        else if ((a == "-s" || a == "--slots") && i + 1 < argc)
            opt.hex.pool_slots = opt.hex.queue_slots = parse_positive(argv[++i], opt.hex.pool_slots);
        else if (a == "-h" || a == "--help")
            opt.help = true;
        else
            opt.files.push_back(a);
    }
    return opt;
}

} // namespace

int main(int argc, char** argv) {
    using namespace poolq::core;

    const RuntimeConfig cfg = runtime_config();
    apply_logging_config(cfg);
    Logger& log = Logger::getInstance();

    const Options opt = ParseArgs(argc, argv, cfg);
    if (opt.help) {
        std::cout << "usage: poolq_hexdump [-c|--chunk N] [-s|--slots N] [file...]\n"
                  << "  reads stdin when no file is given\n";
        return 0;
    }

    log.log(LogLevel::Debug, "hexdump start",
            {{"config", cfg.config_path},
             {"chunk", std::to_string(opt.hex.chunk_bytes)},
             {"slots", std::to_string(opt.hex.pool_slots)}});

    // metrics.enable：运行期间安装文本 sink，结束时把汇总写到 stderr。
    TextMetricsSink sink;
    std::unique_ptr<ScopedMetricsSink> metrics_scope;
    if (cfg.metrics_enable) metrics_scope = std::make_unique<ScopedMetricsSink>(sink);

    try {
        const HexdumpStats stats =
            opt.files.empty() ? hexdump_stream(std::cin, std::cout, opt.hex) : hexdump_files(opt.files, std::cout, opt.hex);
        std::cout.flush();
        log.log(LogLevel::Debug, "hexdump done",
                {{"lines", std::to_string(stats.lines)}, {"bytes", std::to_string(stats.bytes)}});
    } catch (const std::exception& e) {
        log.log(LogLevel::Error, "hexdump failed", {{"err", e.what()}});
        return 1;
    }
    if (metrics_scope) {
        metrics_scope.reset();
        std::cerr << sink.render();
    }
    return 0;
}
