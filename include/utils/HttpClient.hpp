#pragma once
#include <string>

namespace ShareMonitor {

class HttpClient {
public:
    HttpClient();

    struct Response {
        int statusCode;
        std::string body;
        bool success;
        std::string error;
    };

    // curl_global_init is not thread-safe; call once from main before any worker starts
    static void globalInit();
    static std::string urlEncode(const std::string& value);

    Response get(const std::string& url);
    void setTimeout(long timeoutSeconds);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    std::string userAgent_;
    long timeout_;
};

}
