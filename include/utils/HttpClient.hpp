#pragma once
#include <string>
#include <map>

namespace DryDock {

class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    struct Response {
        int statusCode;
        std::string body;
        std::map<std::string, std::string> headers;
        bool success;
        std::string error;
    };

    // Blocking; bounded by the configured timeout.
    virtual Response get(const std::string& url);
    virtual Response post(const std::string& url, const std::string& body,
                          const std::string& contentType = "application/json");

    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);
    void setMaxRedirects(long maxRedirects);
    long timeout() const { return timeout_; }
    long maxRedirects() const { return maxRedirects_; }
    const std::string& userAgent() const { return userAgent_; }

    static const char* defaultUserAgent();

private:
    Response perform(const std::string& url, const std::string* postBody, const std::string& contentType);
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    long timeout_;
    long maxRedirects_;
};

}
