/*
 * NovelForge C++ - HTTP Client
 *
 * Minimal libcurl wrapper for JSON POSTs to model servers. Each request
 * honors a timeout and an optional cancellation token (checked from the
 * transfer progress callback).
 */
#ifndef novelforge_CORE_HTTP_CLIENT_HPP
#define novelforge_CORE_HTTP_CLIENT_HPP

#include <novelforge/core/json.hpp>
#include <novelforge/core/cancellation.hpp>
#include <map>
#include <string>
#include <cstdint>

namespace novelforge {

struct HttpResponse {
    int status_code;       // 0 when the request never got a response
    std::string body;
    std::string error;     // Transport error description
    bool timed_out;
    bool cancelled;

    HttpResponse() : status_code(0), timed_out(false), cancelled(false) {}

    // Parsed body, or a discarded value if it is not JSON
    Json json() const;
};

class HttpClient {
public:
    HttpClient();

    void set_timeout_ms(int64_t timeout_ms) { timeout_ms_ = timeout_ms; }
    void set_cancellation(const CancellationToken* token) { cancel_token_ = token; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);

    // curl_global_init / curl_global_cleanup, once per process
    static void global_init();
    static void global_cleanup();

private:
    int64_t timeout_ms_;
    const CancellationToken* cancel_token_;
};

} // namespace novelforge

#endif // novelforge_CORE_HTTP_CLIENT_HPP
