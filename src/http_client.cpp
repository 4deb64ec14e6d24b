#include "http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace v2n {

namespace {

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw HttpError("curl_global_init failed");
        }
    });
}

size_t write_body(char* data, size_t size, size_t count, void* user) {
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int check_cancel(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(user);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

class HttpClient::Impl {
public:
    Impl() { ensure_global_init(); }

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers,
                      std::chrono::seconds timeout,
                      const CancellationToken* cancel) const {
        if (cancel && cancel->cancelled()) {
            throw HttpError("Request to " + url + " cancelled", true);
        }

        // Easy handles are not shared between threads; one per request
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl) {
            throw HttpError("curl_easy_init failed");
        }

        curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
        for (const auto& [name, value] : headers) {
            raw_list = curl_slist_append(raw_list, (name + ": " + value).c_str());
        }
        std::unique_ptr<curl_slist, HeaderListDeleter> header_list(raw_list);

        HttpResponse response;
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, check_cancel);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));

        CURLcode code = curl_easy_perform(curl.get());
        if (code == CURLE_ABORTED_BY_CALLBACK) {
            throw HttpError("Request to " + url + " cancelled", true);
        }
        if (code != CURLE_OK) {
            std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(code);
            throw HttpError("Request to " + url + " failed: " + detail);
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }
};

HttpClient::HttpClient() : pimpl_(std::make_unique<Impl>()) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers,
                                   std::chrono::seconds timeout,
                                   const CancellationToken* cancel) const {
    return pimpl_->post(url, body, headers, timeout, cancel);
}

} // namespace v2n
