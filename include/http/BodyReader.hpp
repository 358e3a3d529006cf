#pragma once

#include "http/curlWrappers.hpp"
#include "io/Reader.hpp"

#include <cstdint>
#include <string>

namespace pawup::http {

// Streams a GET response body on demand through a curl multi handle, so callers pull bytes
// instead of curl pushing the whole body into memory. The transfer aborts before the body
// grows past maxBytes.
class BodyReader final : public io::Reader {
public:
    BodyReader(std::string url, uintmax_t maxBytes);
    ~BodyReader() override;

    BodyReader(const BodyReader&) = delete;
    BodyReader& operator=(const BodyReader&) = delete;

    size_t read(char* buf, size_t len) override;

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] uintmax_t received() const { return received_; }

private:
    static size_t onWrite(char* data, size_t size, size_t nmemb, void* self);

    void pump();
    [[noreturn]] void fail(CURLcode code) const;

    std::string url_;
    uintmax_t maxBytes_;
    uintmax_t received_ = 0;

    CurlEasy easy_;
    CURLM* multi_ = nullptr;
    char errBuf_[CURL_ERROR_SIZE] = {};

    std::string pending_;
    size_t pendingPos_ = 0;
    bool done_ = false;
    bool limitHit_ = false;
};

}
