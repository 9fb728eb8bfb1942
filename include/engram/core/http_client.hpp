#ifndef ENGRAM_CORE_HTTP_CLIENT_HPP
#define ENGRAM_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <map>
#include <curl/curl.h>

namespace engram {

typedef std::map<std::string, std::string> HttpHeaders;

struct HttpResponse {
    long status_code;
    std::string body;
    std::string error;

    HttpResponse() : status_code(0) {}

    bool ok() const { return status_code >= 200 && status_code < 300 && error.empty(); }

    // Parsed body; sets err and returns null on malformed JSON
    Json json(std::string& err) const;
};

// Blocking HTTP client using libcurl. One easy handle per client, so an
// instance must not be shared between threads without external locking.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    void set_timeout(long ms);
    long timeout() const { return timeout_ms_; }

    HttpResponse get(const std::string& url, const HttpHeaders& headers = HttpHeaders());

    HttpResponse post_json(const std::string& url,
                           const Json& body,
                           const HttpHeaders& extra_headers = HttpHeaders());

private:
    CURL* curl_;
    long timeout_ms_;

    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    HttpResponse perform_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const HttpHeaders& headers);

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace engram

#endif // ENGRAM_CORE_HTTP_CLIENT_HPP
