// =================================================================
// include/Loom/Errors.hpp
// =================================================================
// Exception types raised by the external collaborators.

#pragma once

#include <stdexcept>
#include <string>

namespace Loom {

/**
 * @brief A git invocation failed or produced unusable output
 */
class GitError : public std::runtime_error {
public:
    explicit GitError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The message-generation service failed (transport, HTTP status or payload)
 */
class AiServiceError : public std::runtime_error {
public:
    explicit AiServiceError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), m_status_code(status_code) {}

    /// HTTP status of the failed request, or 0 when no response was received
    int getStatusCode() const { return m_status_code; }

private:
    int m_status_code;
};

} // namespace Loom
