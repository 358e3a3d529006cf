#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pawup::io {

// Pull-style byte source. read() returns 0 only at end of stream; failures throw.
class Reader {
public:
    virtual ~Reader() = default;

    virtual size_t read(char* buf, size_t len) = 0;

    /// Drains the rest of the stream into memory.
    std::vector<char> readAll();
};

class BufferReader final : public Reader {
public:
    explicit BufferReader(std::vector<char> data) : data_(std::move(data)) {}
    explicit BufferReader(const std::string& data) : data_(data.begin(), data.end()) {}

    size_t read(char* buf, size_t len) override;

private:
    std::vector<char> data_;
    size_t pos_ = 0;
};

}
