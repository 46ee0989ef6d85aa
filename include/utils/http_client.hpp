#pragma once

#include <string>
#include <vector>

namespace livenotes {
namespace utils {

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

/**
 * One part of a multipart/form-data body. A non-empty filename turns the part
 * into a file upload whose bytes are taken from value.
 */
struct MultipartField {
    std::string name;
    std::string value;
    std::string filename;
    std::string content_type;
};

/**
 * Minimal blocking HTTP client over libcurl.
 *
 * Each request uses its own easy handle, so one client may be shared by
 * several worker threads. Transport errors, timeouts and non-2xx responses
 * throw HttpException.
 */
class HttpClient {
public:
    explicit HttpClient(long timeout_ms = 30000);

    HttpResponse postJson(const std::string& url, const std::string& body,
                          const std::vector<std::string>& headers = {}) const;

    HttpResponse postMultipart(const std::string& url, const std::vector<MultipartField>& fields,
                               const std::vector<std::string>& headers = {}) const;

    long getTimeoutMs() const { return timeout_ms_; }

    // curl_global_init, run once per process
    static void globalInit();

private:
    long timeout_ms_;
};

} // namespace utils
} // namespace livenotes
