#include "utils/http_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace livenotes {
namespace utils {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct CurlMimeDeleter {
    void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;
using CurlMime = std::unique_ptr<curl_mime, CurlMimeDeleter>;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CurlHeaders buildHeaders(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(list, header.c_str());
        if (!appended) {
            curl_slist_free_all(list);
            throw HttpException("Failed to build request headers");
        }
        list = appended;
    }
    return CurlHeaders(list);
}

CurlHandle createHandle(const std::string& url, long timeout_ms, std::string* response_body) {
    CurlHandle handle(curl_easy_init());
    if (!handle) {
        throw HttpException("Failed to initialize CURL", 0, url);
    }

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, response_body);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    return handle;
}

HttpResponse perform(CURL* handle, const std::string& url, std::string& body) {
    CURLcode res = curl_easy_perform(handle);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw HttpException("Request timed out", 0, url);
    }
    if (res != CURLE_OK) {
        throw HttpException(std::string("Request failed: ") + curl_easy_strerror(res), 0, url);
    }

    HttpResponse response;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.body = std::move(body);

    if (response.status_code < 200 || response.status_code >= 300) {
        std::string snippet = response.body.substr(0, 200);
        throw HttpException("Unexpected response: " + snippet, response.status_code, url);
    }

    Logger::debug("HTTP " + std::to_string(response.status_code) + " from " + url +
                  ", " + std::to_string(response.body.size()) + " bytes");
    return response;
}

} // namespace

HttpClient::HttpClient(long timeout_ms) : timeout_ms_(timeout_ms) {
    globalInit();
}

void HttpClient::globalInit() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            throw HttpException("curl_global_init failed");
        }
    });
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& body,
                                  const std::vector<std::string>& headers) const {
    std::string response_body;
    CurlHandle handle = createHandle(url, timeout_ms_, &response_body);

    std::vector<std::string> all_headers = headers;
    all_headers.push_back("Content-Type: application/json");
    CurlHeaders header_list = buildHeaders(all_headers);

    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    return perform(handle.get(), url, response_body);
}

HttpResponse HttpClient::postMultipart(const std::string& url, const std::vector<MultipartField>& fields,
                                       const std::vector<std::string>& headers) const {
    std::string response_body;
    CurlHandle handle = createHandle(url, timeout_ms_, &response_body);
    CurlHeaders header_list = buildHeaders(headers);

    CurlMime mime(curl_mime_init(handle.get()));
    if (!mime) {
        throw HttpException("Failed to create multipart body", 0, url);
    }

    for (const auto& field : fields) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, field.name.c_str());
        curl_mime_data(part, field.value.data(), field.value.size());
        if (!field.filename.empty()) {
            curl_mime_filename(part, field.filename.c_str());
        }
        if (!field.content_type.empty()) {
            curl_mime_type(part, field.content_type.c_str());
        }
    }

    if (header_list) {
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    curl_easy_setopt(handle.get(), CURLOPT_MIMEPOST, mime.get());

    return perform(handle.get(), url, response_body);
}

} // namespace utils
} // namespace livenotes
