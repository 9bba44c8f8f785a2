#pragma once

#include "config.hpp"
#include "suggestion_client.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace sorter {

// Gemini generateContent over HTTPS (libcurl). One blocking request per
// call; safe to use from a single worker thread.
class gemini_client : public suggestion_client {
public:
    // Throws std::runtime_error if libcurl cannot be initialised or no API
    // key is configured.
    gemini_client(const suggestion_config& cfg, std::shared_ptr<spdlog::logger> log);
    ~gemini_client() override;

    gemini_client(const gemini_client&) = delete;
    gemini_client& operator=(const gemini_client&) = delete;

    suggestion_result generate(const std::string& model, const std::string& prompt) override;

    // generateContent URL for `model`, with the model id percent-encoded.
    std::string request_url(const std::string& model) const;

    // Request body for a single-turn text prompt.
    static std::string build_request_body(const std::string& prompt);

    // Concatenated text of the first candidate. Fails on malformed JSON,
    // an API error object, or a response with no text parts.
    static suggestion_result parse_response(const std::string& body);

private:
    std::string m_endpoint;
    std::string m_api_key;
    long m_timeout_seconds;
    std::shared_ptr<spdlog::logger> m_log;
    void* m_curl = nullptr;
};

} // namespace sorter
