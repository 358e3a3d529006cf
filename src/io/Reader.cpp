#include "io/Reader.hpp"

#include <algorithm>
#include <cstring>

namespace pawup::io {

std::vector<char> Reader::readAll() {
    std::vector<char> out;
    char chunk[64 * 1024];
    while (const size_t n = read(chunk, sizeof(chunk))) out.insert(out.end(), chunk, chunk + n);
    return out;
}

size_t BufferReader::read(char* buf, const size_t len) {
    const size_t n = std::min(len, data_.size() - pos_);
    if (n) std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

}
