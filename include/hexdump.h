#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "byte_chunk.h"
#include "command_loop.h"
#include "logger.h"
#include "pool_queue.h"

namespace poolq::core {

struct HexdumpOptions {
    std::size_t chunk_bytes{16};
    std::size_t pool_slots{2};
    std::size_t queue_slots{2};
    // hexdump_files 的 CommandLoop 选项。
    CommandLoopOptions loop{"hexdump_files", true};
};

struct HexdumpStats {
    std::uint64_t lines{0};
    std::uint64_t bytes{0};
};

// 生产者（调用线程）按 chunk_bytes 读取 in，消费者（独立线程）把每个非 eof 分块
// 以一行两位十六进制写入 out。读完后发送 eof 分块，消费者见到 eof 即结束。
HexdumpStats hexdump_stream(std::istream& in, std::ostream& out, const HexdumpOptions& opts = {});

// 每个路径作为一条命令交给 CommandLoop；production function 打开文件并逐块生产。
// loop 退出时 queue 被 seal，消费者输出完已生产的分块后结束。
// 文件打开失败时 loop 以 Warn 结束，已生产的分块仍会输出。
HexdumpStats hexdump_files(const std::vector<std::string>& paths,
                           std::ostream& out,
                           const HexdumpOptions& opts = {},
                           const Logger& logger = Logger::getInstance());

// 消费者主体：循环 consume 直到遇到 eof 分块，或 queue 被 seal 且已取空。
void write_hex_lines(PoolQueue<ByteChunk>& pq, std::ostream& out, HexdumpStats& stats);

} // namespace poolq::core
