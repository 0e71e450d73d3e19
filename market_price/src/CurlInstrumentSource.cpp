#include "CurlInstrumentSource.hpp"
#include "Errors.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

CurlInstrumentSource::CurlInstrumentSource(long timeout_ms)
    : timeout_ms_(timeout_ms)
{}

std::vector<std::string> CurlInstrumentSource::fetch_instruments(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) throw FetchError("curl init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "User-Agent: market-price/1.0");

    std::string resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // TLS verify ON
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        throw FetchError(std::string("curl perform failed: ") + curl_easy_strerror(rc));
    }
    if (http_code < 200 || http_code >= 300) {
        throw FetchError("http " + std::to_string(http_code) + " from " + url);
    }
    return parse_instrument_response(resp);
}

std::vector<std::string> parse_instrument_response(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw FetchError("instrument response is not a json object");
    }

    // venue-level error: {"code":"51001","msg":"...","data":[]}
    if (j.contains("code") && j["code"].is_string() && j["code"].get<std::string>() != "0") {
        throw FetchError("venue error " + j["code"].get<std::string>() + ": " + j.value("msg", ""));
    }

    if (!j.contains("data") || !j["data"].is_array()) {
        throw FetchError("instrument response has no data list");
    }

    std::vector<std::string> out;
    out.reserve(j["data"].size());
    for (const auto& e : j["data"]) {
        if (!e.is_object() || !e.contains("instId") || !e["instId"].is_string()) continue;
        out.push_back(e["instId"].get<std::string>());
    }
    return out;
}
