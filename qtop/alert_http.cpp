#include "qtop/alert_http.h"

#include <curl/curl.h>

#include <mutex>
#include <string>
#include <utility>

namespace qtop {
namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() {
        // libcurl requires global init before any easy handles are created.
        (void)curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

size_t curl_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t n = size * nmemb;
    auto* s = static_cast<std::string*>(userp);
    s->append(static_cast<const char*>(contents), n);
    return n;
}

// Owns the easy handle and header list for one request.
class CurlRequest {
   public:
    CurlRequest() : curl_(curl_easy_init()) {}
    ~CurlRequest() {
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    CURL* get() const { return curl_; }
    void add_header(const std::string& h) { headers_ = curl_slist_append(headers_, h.c_str()); }
    curl_slist* headers() const { return headers_; }

   private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

StatusV1 perform(const HttpAlertConfigV1& cfg, const std::string& url, const std::string* post_body) {
    ensure_curl_global_init();
    CurlRequest req;
    if (!req.get()) return StatusV1::Error("curl_easy_init failed");

    std::string resp;
    resp.reserve(256);

    if (post_body) req.add_header("Content-Type: application/json");
    if (!cfg.token.empty()) req.add_header("Authorization: Bearer " + cfg.token);

    CURL* curl = req.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (req.headers()) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, req.headers());
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) return StatusV1::Error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc));

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    if (code < 200 || code >= 300) {
        std::string msg = "HTTP " + std::to_string(code) + " from " + url;
        if (!resp.empty()) msg += ": " + resp.substr(0, 200);
        return StatusV1::Error(msg);
    }
    return StatusV1::Ok();
}

}  // namespace

std::string url_origin_v1(const std::string& url) {
    const std::size_t scheme = url.find("://");
    if (scheme == std::string::npos) return url;
    const std::size_t path = url.find_first_of("/?#", scheme + 3);
    if (path == std::string::npos) return url;
    return url.substr(0, path);
}

HttpAlertSinkV1::HttpAlertSinkV1(HttpAlertConfigV1 cfg) : cfg_(std::move(cfg)) {}

StatusV1 HttpAlertSinkV1::send(const AlertEventV1& ev) {
    const std::string body = alert_event_json_v1(ev);
    return perform(cfg_, cfg_.url, &body);
}

StatusV1 HttpAlertSinkV1::healthz() { return perform(cfg_, url_origin_v1(cfg_.url) + "/healthz", nullptr); }

}  // namespace qtop
