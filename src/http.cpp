#include "http.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>

namespace {

size_t write_data(void* ptr, size_t size, size_t nmemb, void* stream) {
    auto* out = static_cast<std::string*>(stream);
    size_t bytes = size * nmemb;
    out->append(static_cast<char*>(ptr), bytes);
    return bytes;
}

// Aborts the transfer once the task is cancelled or past its deadline
int progress_callback(void* clientp, [[maybe_unused]] curl_off_t dltotal, [[maybe_unused]] curl_off_t dlnow,
                      [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    const auto* ctx = static_cast<const TaskContext*>(clientp);
    return (ctx->cancelled() || ctx->expired()) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // anonymous namespace

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

std::string url_escape(std::string_view value) {
    char* escaped = curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size()));
    if (!escaped) {
        throw PlugdbException(string_format("error.url_escape_failed", std::string(value)));
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout) : timeout_(timeout) {}

HttpResponse CurlHttpClient::get(const std::string& url, const TaskContext& ctx) {
    return perform(url, false, ctx);
}

HttpResponse CurlHttpClient::head(const std::string& url, const TaskContext& ctx) {
    return perform(url, true, ctx);
}

HttpResponse CurlHttpClient::perform(const std::string& url, bool head_only, const TaskContext& ctx) {
    ctx.check();

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw PlugdbException(string_format("error.request_failed", url, get_string("error.curl_init_failed")));
    }

    HttpResponse response;
    const long timeout_ms = static_cast<long>(std::min<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count(),
        std::max<long long>(ctx.remaining().count(), 1)));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "plugdb");
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
    if (head_only) {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK || res == CURLE_OPERATION_TIMEDOUT) {
        ctx.check();
    }
    if (res != CURLE_OK) {
        throw PlugdbException(string_format("error.request_failed", url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    char* effective_url = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
    response.effective_url = effective_url ? effective_url : url;

    log_debug(string_format("debug.http_response", head_only ? "HEAD" : "GET", url, response.status));
    return response;
}
