#include "signed_client.h"

#include <mutex>
#include <utility>

#include <curl/curl.h>

namespace iam_probe {

namespace {

size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    out->append(ptr, total);
    return total;
}

std::string TrimTrailingSlash(const std::string& s) {
    if (!s.empty() && s.back() == '/') {
        return s.substr(0, s.size() - 1);
    }
    return s;
}

// Frees the easy handle and header list on every return path.
struct CurlRequest {
    CURL* curl = curl_easy_init();
    struct curl_slist* headers = nullptr;

    ~CurlRequest() {
        curl_slist_free_all(headers);
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

} // namespace

std::string FormEncode(const util::Params& params) {
    std::string out;
    for (const auto& kv : params) {
        if (!out.empty()) {
            out.push_back('&');
        }
        out += util::percent_encode(kv.first, true);
        out.push_back('=');
        out += util::percent_encode(kv.second, true);
    }
    return out;
}

SignedClient::SignedClient(Config cfg, auth::Credentials creds)
    : cfg_(std::move(cfg)), creds_(std::move(creds)) {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

std::string SignedClient::HostHeader() const {
    std::string host = TrimTrailingSlash(cfg_.endpoint);
    size_t scheme = host.find("://");
    if (scheme != std::string::npos) {
        host = host.substr(scheme + 3);
    }
    size_t slash = host.find('/');
    if (slash != std::string::npos) {
        host = host.substr(0, slash);
    }
    return host;
}

bool SignedClient::Query(const std::string& service,
                         const std::string& action,
                         const util::Params& params,
                         Response* out,
                         std::string* err) const {
    util::Params form;
    form.emplace_back("Action", action);
    form.emplace_back("Version", service == "sts" ? "2011-06-15" : "2010-05-08");
    form.insert(form.end(), params.begin(), params.end());
    return Send("POST", "/", FormEncode(form), "application/x-www-form-urlencoded; charset=utf-8",
                service, auth::SignerFlavor::Generic, out, err);
}

bool SignedClient::Storage(const std::string& method,
                           const std::string& target,
                           const std::string& body,
                           Response* out,
                           std::string* err) const {
    return Send(method, target, body, "application/octet-stream", "s3", auth::SignerFlavor::Object, out, err);
}

bool SignedClient::Send(const std::string& method,
                        const std::string& target,
                        const std::string& body,
                        const std::string& content_type,
                        const std::string& service,
                        auth::SignerFlavor flavor,
                        Response* out,
                        std::string* err) const {
    auth::SigningRequest req;
    req.method = method;
    req.target = target;
    req.body = body;
    req.headers.emplace_back("Host", HostHeader());
    if (!content_type.empty()) {
        req.headers.emplace_back("Content-Type", content_type);
    }
    auth::sign_request(req, creds_, service, cfg_.region, flavor, util::unix_now_seconds());

    CurlRequest r;
    if (!r.curl) {
        if (err) *err = "curl_easy_init failed";
        return false;
    }
    for (const auto& h : req.headers) {
        r.headers = curl_slist_append(r.headers, (h.first + ": " + h.second).c_str());
    }
    // The body is signed as-is; no 100-continue round trip.
    r.headers = curl_slist_append(r.headers, "Expect:");

    const std::string url = TrimTrailingSlash(cfg_.endpoint) + target;
    curl_easy_setopt(r.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(r.curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(r.curl, CURLOPT_HTTPHEADER, r.headers);
    curl_easy_setopt(r.curl, CURLOPT_TIMEOUT_MS, cfg_.timeout_ms);
    curl_easy_setopt(r.curl, CURLOPT_CONNECTTIMEOUT_MS, cfg_.connect_timeout_ms);
    curl_easy_setopt(r.curl, CURLOPT_NOSIGNAL, 1L);

    if (!cfg_.verify_tls) {
        curl_easy_setopt(r.curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(r.curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    if (method == "HEAD") {
        curl_easy_setopt(r.curl, CURLOPT_NOBODY, 1L);
    } else if (!body.empty()) {
        curl_easy_setopt(r.curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(r.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    Response resp;
    curl_easy_setopt(r.curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(r.curl, CURLOPT_WRITEDATA, &resp.body);

    CURLcode res = curl_easy_perform(r.curl);
    if (res != CURLE_OK) {
        if (err) *err = curl_easy_strerror(res);
        return false;
    }
    curl_easy_getinfo(r.curl, CURLINFO_RESPONSE_CODE, &resp.status);
    if (out) {
        *out = std::move(resp);
    }
    return true;
}

} // namespace iam_probe
