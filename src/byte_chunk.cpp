#include "byte_chunk.h"

#include <istream>
#include <stdexcept>

namespace poolq::core {

ByteChunk::ByteChunk(std::size_t capacity) : buf_(capacity, 0) {
    if (capacity == 0) {
        throw std::invalid_argument("chunk capacity must be positive");
    }
}

void ByteChunk::set_size(std::size_t n) {
    if (n > buf_.size()) {
        throw std::out_of_range("chunk size exceeds capacity");
    }
    size_ = n;
}

std::size_t read_chunk(std::istream& in, ByteChunk& chunk) {
    chunk.reset();
    in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.capacity()));
    const auto n = static_cast<std::size_t>(in.gcount());
    chunk.set_size(n);
    if (n == 0) {
        chunk.set_eof(true);
    }
    return n;
}

std::string format_hex(const ByteChunk& chunk) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    if (chunk.size() == 0) return out;
    out.reserve(chunk.size() * 3 - 1);
    const std::uint8_t* p = chunk.data();
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        if (i != 0) out.push_back(' ');
        out.push_back(kDigits[p[i] >> 4]);
        out.push_back(kDigits[p[i] & 0x0f]);
    }
    return out;
}

} // namespace poolq::core
