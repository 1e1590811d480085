#include "utils/HttpClient.hpp"
#include <curl/curl.h>
#include <cctype>
#include <cstdio>
#include <mutex>

namespace ShareMonitor {

namespace {
std::once_flag curlInitFlag;
}

HttpClient::HttpClient()
    : userAgent_("Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36"), timeout_(30) {
    globalInit();
}

void HttpClient::globalInit() {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string HttpClient::urlEncode(const std::string& value) {
    std::string result;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpClient::Response HttpClient::get(const std::string& url) {
    Response response{0, "", false, ""};
    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) response.error = "HTTP " + std::to_string(httpCode);
    } else {
        response.error = curl_easy_strerror(res);
    }
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setTimeout(long t) { timeout_ = t; }

}
