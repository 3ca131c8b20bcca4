/*
 * convoflow C++ - HTTP client (libcurl)
 *
 * Blocking JSON POST plus a streaming POST that hands body bytes to a
 * callback as they arrive and can be aborted from another thread through
 * the progress callback. curl_global_init() is the application's job.
 */
#ifndef convoflow_CORE_HTTP_CLIENT_HPP
#define convoflow_CORE_HTTP_CLIENT_HPP

#include <convoflow/core/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace convoflow {

struct HttpResponse {
    int status_code;            // 0 when the transfer itself failed
    std::string body;
    std::string error;
    bool aborted;

    HttpResponse() : status_code(0), aborted(false) {}

    // Parsed body, discarded value when it is not JSON
    Json json() const;
};

// Return false to stop the transfer
typedef std::function<bool(const char* data, size_t len)> StreamDataCallback;
// Polled while the transfer runs; true aborts it
typedef std::function<bool()> AbortCheck;

class HttpClient {
public:
    HttpClient();

    void set_timeout_ms(long timeout_ms) { timeout_ms_ = timeout_ms; }
    void set_connect_timeout_ms(long timeout_ms) { connect_timeout_ms_ = timeout_ms; }

    HttpResponse post_json(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers);

    // Body bytes go to on_data and are not kept in the response, except for
    // non-2xx replies whose body is captured for the error message.
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::map<std::string, std::string>& headers,
                             StreamDataCallback on_data,
                             AbortCheck should_abort);

private:
    long timeout_ms_;
    long connect_timeout_ms_;
};

// Splits a server-sent-events byte stream into the payloads of its
// "data:" lines. Partial lines are kept until the rest arrives.
class SseLineBuffer {
public:
    std::vector<std::string> feed(const char* data, size_t len);
    std::vector<std::string> feed(const std::string& data) { return feed(data.data(), data.size()); }

    // Whatever is left after the stream closed
    std::vector<std::string> finish();

private:
    void take_line(std::string line, std::vector<std::string>& out);

    std::string pending_;
};

} // namespace convoflow

#endif // convoflow_CORE_HTTP_CLIENT_HPP
