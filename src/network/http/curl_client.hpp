#pragma once
#include "http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

namespace SeoAudit {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    // Throws std::runtime_error when libcurl cannot allocate a handle.
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_timeout(std::chrono::seconds timeout) override;
    void     set_user_agent(const std::string& user_agent) override;
    Response get(const std::string& url) override;

private:
    struct RequestContext {
        std::string* body         = nullptr;
        std::string* content_type = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    long                               timeout_seconds_;
    std::string                        user_agent_;

    Response handle_response(CURLcode           res,
                             long               response_code,
                             const std::string& effective_url,
                             std::string&       body,
                             std::string&       content_type) const;

    // userp is always a RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace SeoAudit
