#include "curl_client.hpp"
#include <algorithm>
#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include "../../core/types/constants.hpp"

namespace SeoAudit {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";
constexpr std::string_view STATUS_LINE_PREFIX  = "http/";

inline std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_SSL_CONNECT_ERROR: return ErrorType::Network;
        default: return ErrorType::Other;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto*  ctx   = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return total;

    std::string_view header(buffer, total);

    // Every hop of a redirect chain starts with a status line.
    if (istarts_with(header, STATUS_LINE_PREFIX)) {
        ctx->content_type->clear();
        return total;
    }

    if (!istarts_with(header, CONTENT_TYPE_HEADER))
        return total;

    *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return total;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      timeout_seconds_(Core::Constants::REQUEST_TIMEOUT_SECONDS),
      user_agent_(Core::Constants::USER_AGENT) {
    if (!curl_)
        throw std::runtime_error("Failed to initialize CURL handle");
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_seconds_ = static_cast<long>(timeout.count());
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

Response CurlClient::handle_response(CURLcode           res,
                                     long               response_code,
                                     const std::string& effective_url,
                                     std::string&       body,
                                     std::string&       content_type) const {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = response_code;
    response.content_type  = content_type;

    if (res != CURLE_OK) {
        response.success     = false;
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = 0;
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code >= Core::Constants::HTTP_SUCCESS_MIN
                        && response.status_code < Core::Constants::HTTP_ERROR_MIN);
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Status;
    }
    return response;
}

Response CurlClient::get(const std::string& url) {
    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type};

    CURL* curl = curl_.get();
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());

    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(
        curl_slist_append(nullptr, Core::Constants::ACCEPT_HEADER));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    CURLcode res           = curl_easy_perform(curl);
    long     response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    std::string effective_url = eff_url_ptr ? std::string(eff_url_ptr) : url;

    return handle_response(res, response_code, effective_url, body, content_type);
}

}  // namespace Http
}  // namespace Network
}  // namespace SeoAudit
