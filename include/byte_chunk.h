#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace poolq::core {

// 字节流的可复用分块。
// - 存储在构造时按 capacity 一次性分配，之后随 item 在 pool/queue 间 move，不再重新分配。
// - size() 为本轮写入的有效字节数；eof 为流结束标记（应用层约定，core 不解释）。
class ByteChunk {
public:
    explicit ByteChunk(std::size_t capacity = 16);

    std::uint8_t* data() { return buf_.data(); }
    const std::uint8_t* data() const { return buf_.data(); }
    std::size_t capacity() const { return buf_.size(); }

    std::size_t size() const { return size_; }
    void set_size(std::size_t n);

    bool eof() const { return eof_; }
    void set_eof(bool eof) { eof_ = eof; }

    // 清空有效数据与 eof 标记，保留存储。
    void reset() {
        size_ = 0;
        eof_ = false;
    }

private:
    std::vector<std::uint8_t> buf_;
    std::size_t size_{0};
    bool eof_{false};
};

// 从流中读取最多 capacity() 字节；读到 0 字节时置 eof。返回读取的字节数。
std::size_t read_chunk(std::istream& in, ByteChunk& chunk);

// 以空格分隔的两位小写十六进制格式化有效字节，例如 "00 01 0a ff"。
std::string format_hex(const ByteChunk& chunk);

} // namespace poolq::core
