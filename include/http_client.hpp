#pragma once

#include "worker_pool.hpp"
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace v2n {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Transport-level failure: DNS, connect, TLS, timeout or cancellation
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& message, bool cancelled = false)
        : std::runtime_error(message), cancelled_(cancelled) {}

    bool cancelled() const { return cancelled_; }

private:
    bool cancelled_;
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Any HTTP status is returned as a response; only transport failures throw.
    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers,
                           std::chrono::seconds timeout,
                           const CancellationToken* cancel = nullptr) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace v2n
