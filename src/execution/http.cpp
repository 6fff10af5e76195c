#include "execution/http.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

bool http_response::ok() const {
    return status >= 200 && status < 300;
}

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto body = static_cast<string *>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

template <typename T>
static void set_option(CURL *curl, CURLoption option, T value, const string &url) {
    CURLcode res = curl_easy_setopt(curl, option, value);
    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to configure request to {}: {}", url, curl_easy_strerror(res)));
}

http_response curl_post(const http_request &request) {
    // CURLOPT_TIMEOUT_MS 为 0 表示永不超时
    if (request.timeout_ms <= 0)
        throw network_error(fmt::format("refusing to send request to {} without a positive timeout", request.url));

    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl)
        throw network_error("unable to initialize curl for " + request.url);

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    for (auto &[key, value] : request.headers) {
        curl_slist *appended = curl_slist_append(headers.get(), fmt::format("{}: {}", key, value).c_str());
        if (!appended)
            throw network_error("unable to build request headers for " + request.url);
        headers.release();
        headers.reset(appended);
    }

    http_response response;
    set_option(curl.get(), CURLOPT_URL, request.url.c_str(), request.url);
    set_option(curl.get(), CURLOPT_POST, 1L, request.url);
    set_option(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str(), request.url);
    set_option(curl.get(), CURLOPT_POSTFIELDSIZE, (long)request.body.size(), request.url);
    set_option(curl.get(), CURLOPT_HTTPHEADER, headers.get(), request.url);
    set_option(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms, request.url);
    set_option(curl.get(), CURLOPT_NOSIGNAL, 1L, request.url);  // 多线程下超时不能依赖 SIGALRM
    set_option(curl.get(), CURLOPT_WRITEFUNCTION, write_body, request.url);
    set_option(curl.get(), CURLOPT_WRITEDATA, static_cast<void *>(&response.body), request.url);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        bool unreachable = res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST;
        throw network_error(fmt::format("request to {} failed: {}", request.url, curl_easy_strerror(res)), unreachable);
    }

    res = curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to read response status from {}: {}", request.url, curl_easy_strerror(res)));
    DLOG(INFO) << "POST " << request.url << " -> HTTP " << response.status;
    return response;
}

}  // namespace coderun
