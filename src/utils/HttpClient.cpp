#include "utils/HttpClient.hpp"
#include <curl/curl.h>
#include <mutex>

namespace DryDock {

// curl_global_init is not thread-safe; the scheduler and the UI may both build clients.
static std::once_flag curlInitFlag;

HttpClient::HttpClient()
    : userAgent_(defaultUserAgent()), timeout_(30), maxRedirects_(10) {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

const char* HttpClient::defaultUserAgent() {
    return "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko)";
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string header(buffer, size * nitems);
    size_t pos = header.find(':');
    if (pos != std::string::npos) {
        std::string key = header.substr(0, pos);
        std::string val = header.substr(pos + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        val.erase(val.find_last_not_of(" \t\r\n") + 1);
        (*headers)[key] = val;
    }
    return size * nitems;
}

HttpClient::Response HttpClient::get(const std::string& url) {
    return perform(url, nullptr, "");
}

HttpClient::Response HttpClient::post(const std::string& url, const std::string& body,
                                      const std::string& contentType) {
    return perform(url, &body, contentType);
}

HttpClient::Response HttpClient::perform(const std::string& url, const std::string* postBody,
                                         const std::string& contentType) {
    Response response{0, "", {}, false, ""};
    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    struct curl_slist* requestHeaders = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, maxRedirects_);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    // Worker threads must not receive SIGALRM from the resolver timeout
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (postBody) {
        std::string contentHeader = "Content-Type: " + contentType;
        requestHeaders = curl_slist_append(requestHeaders, contentHeader.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, requestHeaders);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postBody->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postBody->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) response.error = "HTTP status " + std::to_string(httpCode);
    } else {
        response.error = curl_easy_strerror(res);
    }
    if (requestHeaders) curl_slist_free_all(requestHeaders);
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setTimeout(long t) { timeout_ = t; }
void HttpClient::setMaxRedirects(long n) { maxRedirects_ = n; }

}
