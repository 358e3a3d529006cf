#include "http/BodyReader.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/core.h>

using namespace pawup::http;
using namespace pawup::error;
using namespace pawup::logging;

BodyReader::BodyReader(std::string url, const uintmax_t maxBytes)
    : url_(std::move(url)), maxBytes_(maxBytes) {
    multi_ = curl_multi_init();
    if (!multi_) throw TransferError("curl_multi_init failed", url_);

    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errBuf_);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &BodyReader::onWrite);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    // Rejects up front when the server announces the size; onWrite covers the rest.
    curl_easy_setopt(easy_, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(maxBytes_));

    if (const auto mc = curl_multi_add_handle(multi_, easy_); mc != CURLM_OK) {
        curl_multi_cleanup(multi_);
        throw TransferError(fmt::format("failed to start transfer of {}: {}", url_, curl_multi_strerror(mc)), url_);
    }

    LogRegistry::http()->debug("[BodyReader] GET {} (limit {} bytes)", url_, maxBytes_);
}

BodyReader::~BodyReader() {
    curl_multi_remove_handle(multi_, easy_);
    curl_multi_cleanup(multi_);
}

size_t BodyReader::onWrite(char* data, const size_t size, const size_t nmemb, void* self) {
    auto* r = static_cast<BodyReader*>(self);
    const size_t n = size * nmemb;
    if (r->received_ + n > r->maxBytes_) {
        r->limitHit_ = true;
        return 0;   // aborts the transfer with CURLE_WRITE_ERROR
    }
    r->received_ += n;
    r->pending_.append(data, n);
    return n;
}

void BodyReader::fail(const CURLcode code) const {
    if (limitHit_ || code == CURLE_FILESIZE_EXCEEDED)
        throw TransferError(fmt::format("response body of {} exceeds the maximum download size of {} bytes",
                                        url_, maxBytes_), url_);

    const std::string detail = errBuf_[0] ? std::string(errBuf_) : std::string(curl_easy_strerror(code));
    throw TransferError(fmt::format("failed to fetch {}: {}", url_, detail), url_);
}

void BodyReader::pump() {
    while (pendingPos_ >= pending_.size() && !done_) {
        pending_.clear();
        pendingPos_ = 0;

        int running = 0;
        if (const auto mc = curl_multi_perform(multi_, &running); mc != CURLM_OK)
            throw TransferError(fmt::format("transfer of {} failed: {}", url_, curl_multi_strerror(mc)), url_);

        int left = 0;
        while (const CURLMsg* msg = curl_multi_info_read(multi_, &left)) {
            if (msg->msg != CURLMSG_DONE) continue;
            done_ = true;
            if (msg->data.result != CURLE_OK) fail(msg->data.result);
        }

        if (!done_ && pending_.empty()) {
            if (const auto mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr); mc != CURLM_OK)
                throw TransferError(fmt::format("transfer of {} failed: {}", url_, curl_multi_strerror(mc)), url_);
        }
    }
}

size_t BodyReader::read(char* buf, const size_t len) {
    pump();
    const size_t n = std::min(len, pending_.size() - pendingPos_);
    if (n == 0) {
        LogRegistry::http()->debug("[BodyReader] {} complete, {} bytes", url_, received_);
        return 0;
    }
    std::memcpy(buf, pending_.data() + pendingPos_, n);
    pendingPos_ += n;
    return n;
}
