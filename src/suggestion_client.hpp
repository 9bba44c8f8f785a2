#pragma once

#include <memory>
#include <string>

namespace sorter {

// Outcome of one suggestion request. A non-empty error means the call
// failed; text is meaningful only on success.
class suggestion_result {
public:
    static suggestion_result ok(std::string text) {
        suggestion_result r;
        r.m_text = std::move(text);
        return r;
    }

    static suggestion_result fail(std::string error) {
        suggestion_result r;
        r.m_error = error.empty() ? std::string("unknown error") : std::move(error);
        return r;
    }

    bool failed() const { return !m_error.empty(); }
    const std::string& error() const { return m_error; }
    const std::string& text() const { return m_text; }

private:
    std::string m_text;
    std::string m_error;
};

// Request/response capability: (model, prompt) -> text or error.
// Implementations must not throw.
class suggestion_client {
public:
    virtual ~suggestion_client() = default;

    virtual suggestion_result generate(const std::string& model, const std::string& prompt) = 0;
};

using suggestion_client_sptr = std::shared_ptr<suggestion_client>;

} // namespace sorter
