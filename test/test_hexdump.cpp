#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "byte_chunk.h"
#include "hexdump.h"
#include "pool_queue.h"

using namespace poolq::core;

namespace {

std::string all_bytes() {
    std::string s(256, '\0');
    for (int i = 0; i < 256; ++i) s[static_cast<std::size_t>(i)] = static_cast<char>(i);
    return s;
}

// 16 行，每行 16 个两位十六进制数，00..ff 顺序排列。
std::string expected_dump() {
    std::string out;
    char buf[4];
    for (int row = 0; row < 16; ++row) {
        for (int col = 0; col < 16; ++col) {
            std::snprintf(buf, sizeof(buf), "%02x", row * 16 + col);
            if (col != 0) out.push_back(' ');
            out += buf;
        }
        out.push_back('\n');
    }
    return out;
}

// 消费者：闭包捕获 eof 标记。
void print_chunks_closure(std::ostream& out, PoolQueue<ByteChunk>& pq) {
    bool eof = false;
    while (!eof) {
        pq.consume([&](ByteChunk& item) {
            if (!item.eof()) out << format_hex(item) << '\n';
            eof = item.eof();
        });
    }
}

// 消费者：eof 标记作为额外参数传入回调，回调返回要回收的 item。
void print_chunks_args(std::ostream& out, PoolQueue<ByteChunk>& pq) {
    bool eof = false;
    while (!eof) {
        pq.consume(
            [&out](ByteChunk& item, bool& done) {
                if (!item.eof()) out << format_hex(item) << '\n';
                done = item.eof();
                return std::move(item);
            },
            eof);
    }
}

using Consumer = void (*)(std::ostream&, PoolQueue<ByteChunk>&);

class hexdump_scenario : public testing::TestWithParam<Consumer> {};

} // namespace

TEST_P(hexdump_scenario, prints_every_byte_once_in_order) {
    std::istringstream din(all_bytes());
    std::ostringstream dout;

    auto pq = PoolQueue<ByteChunk>::emplace(2, 2, std::size_t{16});
    Consumer consume_all = GetParam();
    std::thread consumer([&]() { consume_all(dout, pq); });

    bool eof = false;
    while (!eof) {
        pq.produce(
            [&eof](ByteChunk& item, std::istream& in) -> std::optional<ByteChunk> {
                read_chunk(in, item);
                eof = item.eof();
                return std::move(item);
            },
            din);
    }
    consumer.join();

    EXPECT_EQ(dout.str(), expected_dump());
    EXPECT_EQ(pq.pool_size(), 2u);
    EXPECT_EQ(pq.queue_size(), 0u);
}

INSTANTIATE_TEST_SUITE_P(consumers, hexdump_scenario, testing::Values(&print_chunks_closure, &print_chunks_args));

TEST(hexdump, stream_matches_expected_dump) {
    std::istringstream in(all_bytes());
    std::ostringstream out;
    const HexdumpStats stats = hexdump_stream(in, out);
    EXPECT_EQ(out.str(), expected_dump());
    EXPECT_EQ(stats.lines, 16u);
    EXPECT_EQ(stats.bytes, 256u);
}

TEST(hexdump, stream_with_partial_last_chunk) {
    std::istringstream in(std::string("\x00\x01\x02\x03\x04", 5));
    std::ostringstream out;
    HexdumpOptions opts;
    opts.chunk_bytes = 2;
    opts.pool_slots = 3;
    opts.queue_slots = 1;
    const HexdumpStats stats = hexdump_stream(in, out, opts);
    EXPECT_EQ(out.str(), "00 01\n02 03\n04\n");
    EXPECT_EQ(stats.lines, 3u);
    EXPECT_EQ(stats.bytes, 5u);
}

TEST(hexdump, empty_input_prints_nothing) {
    std::istringstream in;
    std::ostringstream out;
    const HexdumpStats stats = hexdump_stream(in, out);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(stats.lines, 0u);
}

TEST(hexdump, files_are_dumped_in_command_order) {
    const auto dir = std::filesystem::temp_directory_path() / "poolq_hexdump_files";
    std::filesystem::create_directories(dir);
    const std::string bytes = all_bytes();
    const auto first = (dir / "first.bin").string();
    const auto second = (dir / "second.bin").string();
    std::ofstream(first, std::ios::binary) << bytes.substr(0, 128);
    std::ofstream(second, std::ios::binary) << bytes.substr(128);

    std::vector<std::string> lines;
    std::mutex mu;
    Logger logger(LogLevel::Info, "", [&](LogLevel, const std::string& line) {
        std::lock_guard<std::mutex> lk(mu);
        lines.push_back(line);
    });

    std::ostringstream out;
    const HexdumpStats stats = hexdump_files({first, second}, out, {}, logger);
    EXPECT_EQ(out.str(), expected_dump());
    EXPECT_EQ(stats.bytes, 256u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(hexdump, missing_file_stops_with_warning) {
    const auto dir = std::filesystem::temp_directory_path() / "poolq_hexdump_missing";
    std::filesystem::create_directories(dir);
    const auto present = (dir / "present.bin").string();
    std::ofstream(present, std::ios::binary) << std::string("\xab\xcd", 2);

    std::vector<std::string> lines;
    std::mutex mu;
    Logger logger(LogLevel::Info, "", [&](LogLevel, const std::string& line) {
        std::lock_guard<std::mutex> lk(mu);
        lines.push_back(line);
    });

    std::ostringstream out;
    const HexdumpStats stats =
        hexdump_files({present, (dir / "absent.bin").string(), present}, out, {}, logger);
    EXPECT_EQ(out.str(), "ab cd\n");
    EXPECT_EQ(stats.lines, 1u);

    bool warned = false;
    for (const auto& l : lines) {
        if (l.find("[WRN] produce function failed") != std::string::npos) warned = true;
    }
    EXPECT_TRUE(warned);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(hexdump, files_without_auto_close_still_finish) {
    const auto dir = std::filesystem::temp_directory_path() / "poolq_hexdump_no_auto_close";
    std::filesystem::create_directories(dir);
    const auto path = (dir / "data.bin").string();
    std::ofstream(path, std::ios::binary) << std::string("\x01\x02\x03", 3);

    HexdumpOptions opts;
    opts.chunk_bytes = 2;
    opts.loop.auto_close = false;
    Logger quiet(LogLevel::Error, "", [](LogLevel, const std::string&) {});

    std::ostringstream out;
    const HexdumpStats stats = hexdump_files({path}, out, opts, quiet);
    EXPECT_EQ(out.str(), "01 02\n03\n");
    EXPECT_EQ(stats.lines, 2u);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
