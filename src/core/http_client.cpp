#include <novelforge/core/http_client.hpp>
#include <novelforge/core/logger.hpp>

#include <curl/curl.h>

namespace novelforge {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancellationToken* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->is_cancelled()) ? 1 : 0;
}

} // namespace

Json HttpResponse::json() const {
    return Json::parse(body, nullptr, false);
}

HttpClient::HttpClient()
    : timeout_ms_(60000)
    , cancel_token_(nullptr)
{}

void HttpClient::global_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void HttpClient::global_cleanup() {
    curl_global_cleanup();
}

HttpResponse HttpClient::post_json(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers)
{
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (std::map<std::string, std::string>::const_iterator it = headers.begin();
         it != headers.end(); ++it) {
        std::string line = it->first + ": " + it->second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    }
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel_token_));

    CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_OK) {
        long code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
        response.status_code = static_cast<int>(code);
    } else {
        response.error = curl_easy_strerror(rc);
        response.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        response.cancelled = (rc == CURLE_ABORTED_BY_CALLBACK);
        LOG_DEBUG("[HttpClient] POST %s failed: %s", url.c_str(), response.error.c_str());
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace novelforge
