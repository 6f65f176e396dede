#include "hexdump.h"

#include <exception>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "channel.h"
#include "command_loop.h"

namespace poolq::core {

namespace {

PoolQueue<ByteChunk> make_chunk_queue(const HexdumpOptions& opts) {
    PoolQueueOptions<ByteChunk> pq_opts;
    pq_opts.pool_capacity = opts.pool_slots;
    pq_opts.queue_capacity = opts.queue_slots;
    const std::size_t chunk_bytes = opts.chunk_bytes;
    pq_opts.item_factory = [chunk_bytes]() { return ByteChunk(chunk_bytes); };
    return PoolQueue<ByteChunk>(pq_opts);
}

// 读一块并生产；读到流末尾时返回 false 且不生产（分块直接回到 pool）。
bool produce_chunk(PoolQueue<ByteChunk>& pq, std::istream& in) {
    return pq.produce([&in](ByteChunk& chunk) { return read_chunk(in, chunk) > 0; });
}

void produce_eof(PoolQueue<ByteChunk>& pq) {
    ByteChunk chunk = pq.acquire();
    chunk.reset();
    chunk.set_eof(true);
    pq.produce(std::move(chunk));
}

// 消费者线程：异常保存后由调用线程在 join 后重新抛出。
class HexConsumer {
public:
    HexConsumer(PoolQueue<ByteChunk>& pq, std::ostream& out) {
        worker_ = std::thread([this, &pq, &out]() {
            try {
                write_hex_lines(pq, out, stats_);
            } catch (...) {
                error_ = std::current_exception();
                pq.close();
            }
        });
    }

    HexConsumer(const HexConsumer&) = delete;
    HexConsumer& operator=(const HexConsumer&) = delete;

    ~HexConsumer() {
        if (worker_.joinable()) worker_.join();
    }

    HexdumpStats wait() {
        if (worker_.joinable()) worker_.join();
        if (error_) std::rethrow_exception(error_);
        return stats_;
    }

private:
    HexdumpStats stats_;
    std::exception_ptr error_;
    std::thread worker_;
};

} // namespace

void write_hex_lines(PoolQueue<ByteChunk>& pq, std::ostream& out, HexdumpStats& stats) {
    bool eof = false;
    try {
        while (!eof) {
            pq.consume([&](ByteChunk& chunk) {
                eof = chunk.eof();
                if (eof) return;
                out << format_hex(chunk) << '\n';
                ++stats.lines;
                stats.bytes += chunk.size();
            });
        }
    } catch (const ChannelClosed&) {
        // queue 被 seal 且已取空：生产者正常结束。close 则是异常中止，继续抛出。
        if (pq.queue()->closed() || !pq.queue()->sealed()) throw;
    }
}

HexdumpStats hexdump_stream(std::istream& in, std::ostream& out, const HexdumpOptions& opts) {
    PoolQueue<ByteChunk> pq = make_chunk_queue(opts);
    HexConsumer consumer(pq, out);
    try {
        while (produce_chunk(pq, in)) {
        }
        produce_eof(pq);
    } catch (const ChannelClosed&) {
        // 消费者提前失败并关闭了 PoolQueue；其异常在 wait() 中抛出。
        Logger::getInstance().debug("hexdump: consumer stopped before end of input");
    } catch (...) {
        pq.close();
        throw;
    }
    HexdumpStats stats = consumer.wait();
    pq.close();
    return stats;
}

HexdumpStats hexdump_files(const std::vector<std::string>& paths,
                           std::ostream& out,
                           const HexdumpOptions& opts,
                           const Logger& logger) {
    PoolQueue<ByteChunk> pq = make_chunk_queue(opts);

    auto commands = std::make_shared<BoundedChannel<std::string>>(paths.empty() ? 1 : paths.size(), "commands");
    for (const auto& p : paths) {
        commands->put(p);
    }
    commands->seal();

    HexConsumer consumer(pq, out);

    CommandLoop<ByteChunk> loop(
        commands, pq,
        [](const std::string& path, PoolQueue<ByteChunk>& q) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw std::runtime_error("cannot open " + path);
            }
            while (produce_chunk(q, in)) {
            }
        },
        opts.loop, logger);

    if (loop.run() == CommandLoop<ByteChunk>::ExitReason::kProductionFailed) {
        logger.log(LogLevel::Warn, "hexdump: stopped early",
                   {{"files_done", std::to_string(loop.commands_processed())}});
    }
    // 消费者在 queue 被 seal 且取空后结束；auto_close 关闭时由这里 seal。
    pq.queue()->seal();
    HexdumpStats stats = consumer.wait();
    pq.close();
    commands->close();
    return stats;
}

} // namespace poolq::core
