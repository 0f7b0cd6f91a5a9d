#include "detectors/remote_detector.hpp"
#include <curl/curl.h>
#include <mutex>
#include <utility>
#include "core/errors.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"

namespace piiredactor {
namespace detectors {

namespace {

void initCurl() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    if (!userdata)
        return 0;
    std::string& resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

} // namespace

RemoteDetector::RemoteDetector(const std::string& baseUrl,
                               const std::string& language,
                               std::set<std::string> entities,
                               long timeoutSeconds)
    : m_baseUrl(baseUrl),
      m_language(language),
      m_entities(std::move(entities)),
      m_timeoutSeconds(timeoutSeconds) {
    std::string base = baseUrl;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    m_endpoint = base + "/analyze";
    initCurl();
}

std::vector<core::RawSpan> RemoteDetector::Detect(const std::string& text) const {
    const std::string body = post(BuildRequestBody(text));
    std::vector<core::RawSpan> spans = ParseResponse(body, id());
    util::logger::debug("[RemoteDetector] " + std::to_string(spans.size()) + " span(s) from " + m_endpoint);
    return spans;
}

std::string RemoteDetector::BuildRequestBody(const std::string& text) const {
    util::json::JsonValue req = util::json::JsonValue::object();
    req.set("text", text);
    req.set("language", m_language);
    if (!m_entities.empty()) {
        util::json::JsonValue list = util::json::JsonValue::array();
        for (const auto& e : m_entities)
            list.push(e);
        req.set("entities", list);
    }
    return req.dump();
}

std::vector<core::RawSpan> RemoteDetector::ParseResponse(const std::string& body,
                                                         const std::string& sourceId) {
    std::vector<core::RawSpan> spans;
    try {
        util::json::JsonValue doc = util::json::parse(body);
        if (!doc.isArray())
            throw DetectorError("analyzer response is not a JSON array");

        for (const auto& item : doc.items()) {
            int64_t start = item.at("start").asInt();
            int64_t end = item.at("end").asInt();
            if (start < 0 || end < 0)
                throw DetectorError("analyzer returned a negative offset");
            core::RawSpan span;
            span.entityType = item.at("entity_type").asString();
            span.start = static_cast<size_t>(start);
            span.end = static_cast<size_t>(end);
            span.score = item.contains("score") ? item.at("score").asNumber() : 1.0;
            span.sourceId = sourceId;
            spans.push_back(span);
        }
    } catch (const DetectorError&) {
        throw;
    } catch (const std::runtime_error& ex) {
        // json errors
        throw DetectorError(std::string("malformed analyzer response: ") + ex.what());
    }
    return spans;
}

std::string RemoteDetector::post(const std::string& body) const {
    CURL* curl = curl_easy_init();
    if (!curl)
        throw DetectorError("curl_easy_init failed");

    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Expect:"); // disable Expect: 100-continue

    curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, m_timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw DetectorError("POST " + m_endpoint + " failed: " + curl_easy_strerror(res));
    if (status < 200 || status >= 300)
        throw DetectorError("POST " + m_endpoint + " returned HTTP " + std::to_string(status));
    return response;
}

} // namespace detectors
} // namespace piiredactor
