#pragma once

#include "supervisor.hpp"

#include <chrono>
#include <string>
#include <string_view>

struct HttpResponse {
    long status = 0;
    std::string body;
    // URL after following redirects
    std::string effective_url;

    bool ok() const { return status >= 200 && status < 300; }
};

// Redirects are followed. Transport failures throw PlugdbException; any HTTP
// status is returned to the caller.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url, const TaskContext& ctx) = 0;
    virtual HttpResponse head(const std::string& url, const TaskContext& ctx) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::chrono::seconds timeout);

    HttpResponse get(const std::string& url, const TaskContext& ctx) override;
    HttpResponse head(const std::string& url, const TaskContext& ctx) override;

private:
    HttpResponse perform(const std::string& url, bool head_only, const TaskContext& ctx);

    std::chrono::seconds timeout_;
};

// Percent-encodes one query parameter value.
std::string url_escape(std::string_view value);

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
