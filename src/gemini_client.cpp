#include "gemini_client.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <stdexcept>

namespace sorter {

namespace {

std::once_flag curl_global_once;

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

gemini_client::gemini_client(const suggestion_config& cfg, std::shared_ptr<spdlog::logger> log)
    : m_endpoint(cfg.endpoint),
      m_api_key(cfg.api_key),
      m_timeout_seconds(static_cast<long>(cfg.timeout_seconds)),
      m_log(std::move(log))
{
    if (m_api_key.empty()) {
        throw std::runtime_error("gemini_client: no API key (set 'gpt.api_key' or GEMINI_API_KEY)");
    }

    std::call_once(curl_global_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    m_curl = curl_easy_init();
    if (!m_curl) throw std::runtime_error("gemini_client: curl_easy_init failed");

    while (!m_endpoint.empty() && m_endpoint.back() == '/') m_endpoint.pop_back();
}

gemini_client::~gemini_client() {
    if (m_curl) curl_easy_cleanup(m_curl);
}

std::string gemini_client::build_request_body(const std::string& prompt) {
    nlohmann::json body = {
        {"contents", nlohmann::json::array({
            {{"parts", nlohmann::json::array({{{"text", prompt}}})}}
        })}
    };
    return body.dump();
}

suggestion_result gemini_client::parse_response(const std::string& body) {
    try {
        auto resp = nlohmann::json::parse(body);

        if (auto err = resp.find("error"); err != resp.end()) {
            return suggestion_result::fail("API error: " + err->value("message", err->dump()));
        }

        const auto& candidates = resp.at("candidates");
        if (!candidates.is_array() || candidates.empty()) {
            return suggestion_result::fail("response has no candidates");
        }

        std::string text;
        for (const auto& part : candidates.at(0).at("content").at("parts")) {
            if (auto t = part.find("text"); t != part.end() && t->is_string()) {
                text += t->get<std::string>();
            }
        }
        return suggestion_result::ok(std::move(text));

    } catch (const nlohmann::json::exception& e) {
        return suggestion_result::fail(std::string("malformed response: ") + e.what());
    }
}

std::string gemini_client::request_url(const std::string& model) const {
    char* escaped = curl_easy_escape(m_curl, model.c_str(), static_cast<int>(model.size()));
    if (!escaped) throw std::runtime_error("gemini_client: cannot escape model id '" + model + "'");
    std::string url = m_endpoint + "/models/" + escaped + ":generateContent";
    curl_free(escaped);
    return url;
}

suggestion_result gemini_client::generate(const std::string& model, const std::string& prompt) {
    const std::string url = request_url(model);
    const std::string payload = build_request_body(prompt);
    const std::string key_header = "x-goog-api-key: " + m_api_key;

    std::string response;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, key_header.c_str());

    curl_easy_reset(m_curl);
    curl_easy_setopt(m_curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(m_curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(m_curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(m_curl, CURLOPT_TIMEOUT, m_timeout_seconds);
    curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(m_curl);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
        return suggestion_result::fail(std::string("request failed: ") + curl_easy_strerror(rc));
    }

    long status = 0;
    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &status);
    m_log->debug("gemini: POST {} -> HTTP {} ({} bytes)", url, status, response.size());

    if (status < 200 || status >= 300) {
        auto parsed = parse_response(response);
        return suggestion_result::fail("HTTP " + std::to_string(status) +
                                       (parsed.failed() ? ": " + parsed.error() : ""));
    }

    return parse_response(response);
}

} // namespace sorter
