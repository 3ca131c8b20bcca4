#include <convoflow/core/http_client.hpp>
#include <convoflow/core/logger.hpp>

#include <curl/curl.h>

namespace convoflow {

Json HttpResponse::json() const {
    return Json::parse(body, nullptr, false);
}

namespace {

struct StreamContext {
    StreamDataCallback on_data;
    AbortCheck should_abort;
    std::string error_body;
    long status;
    CURL* handle;
    bool stopped;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    std::string* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    StreamContext* ctx = static_cast<StreamContext*>(userdata);

    if (ctx->status == 0) {
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status);
    }
    if (ctx->status != 0 && (ctx->status < 200 || ctx->status >= 300)) {
        ctx->error_body.append(ptr, total);
        return total;
    }
    if (ctx->on_data && !ctx->on_data(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    StreamContext* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->should_abort && ctx->should_abort()) {
        ctx->stopped = true;
        return 1;
    }
    return 0;
}

struct curl_slist* build_headers(const std::map<std::string, std::string>& headers) {
    struct curl_slist* list = nullptr;
    bool has_content_type = false;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin(); it != headers.end(); ++it) {
        if (it->first == "Content-Type") has_content_type = true;
        std::string line = it->first + ": " + it->second;
        list = curl_slist_append(list, line.c_str());
    }
    if (!has_content_type) {
        list = curl_slist_append(list, "Content-Type: application/json");
    }
    return list;
}

} // namespace

HttpClient::HttpClient()
    : timeout_ms_(0)
    , connect_timeout_ms_(10000)
{}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers) {
    HttpResponse response;

    CURL* handle = curl_easy_init();
    if (!handle) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = build_headers(headers);
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms_);
    }

    CURLcode code = curl_easy_perform(handle);
    if (code == CURLE_OK) {
        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);
    } else {
        response.error = curl_easy_strerror(code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(handle);
    return response;
}

HttpResponse HttpClient::post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::map<std::string, std::string>& headers,
                                     StreamDataCallback on_data,
                                     AbortCheck should_abort) {
    HttpResponse response;

    CURL* handle = curl_easy_init();
    if (!handle) {
        response.error = "curl_easy_init failed";
        return response;
    }

    StreamContext ctx;
    ctx.on_data = on_data;
    ctx.should_abort = should_abort;
    ctx.status = 0;
    ctx.handle = handle;
    ctx.stopped = false;

    struct curl_slist* header_list = build_headers(headers);
    header_list = curl_slist_append(header_list, "Accept: text/event-stream");

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_POST, 1L);
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms_);
    }

    CURLcode code = curl_easy_perform(handle);

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    response.status_code = static_cast<int>(status);
    response.body = ctx.error_body;

    if (code != CURLE_OK) {
        if (ctx.stopped) {
            response.aborted = true;
            response.error = "transfer aborted";
        } else {
            response.error = curl_easy_strerror(code);
            response.status_code = 0;
        }
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(handle);

    LOG_DEBUG("[HttpClient] Stream to %s finished: HTTP %d%s", url.c_str(), response.status_code,
              response.aborted ? " (aborted)" : "");
    return response;
}

// ============================================================================
// SseLineBuffer
// ============================================================================

void SseLineBuffer::take_line(std::string line, std::vector<std::string>& out) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
        line.erase(line.size() - 1);
    }
    if (line.compare(0, 5, "data:") != 0) {
        return;     // comments, event names, blank separators
    }
    std::string payload = line.substr(5);
    if (!payload.empty() && payload[0] == ' ') {
        payload.erase(0, 1);
    }
    out.push_back(payload);
}

std::vector<std::string> SseLineBuffer::feed(const char* data, size_t len) {
    std::vector<std::string> out;
    pending_.append(data, len);

    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
        take_line(pending_.substr(start, nl - start), out);
        start = nl + 1;
    }
    pending_.erase(0, start);
    return out;
}

std::vector<std::string> SseLineBuffer::finish() {
    std::vector<std::string> out;
    if (!pending_.empty()) {
        take_line(pending_, out);
        pending_.clear();
    }
    return out;
}

} // namespace convoflow
