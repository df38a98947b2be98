#pragma once
#include <string>
#include <cstddef>

namespace translate
{
namespace helpers
{

// Categorize HTTP errors
enum class HttpErrorType
{
    Success,
    Timeout,
    RateLimited,
    PayloadTooLarge,
    AuthError,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

inline HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        // Network/transport errors
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
    {
        return HttpErrorType::Success;
    }

    switch (status_code)
    {
    case 408: // Request Timeout
    case 504: // Gateway Timeout
        return HttpErrorType::Timeout;
    case 413: // Payload Too Large
        return HttpErrorType::PayloadTooLarge;
    case 429:
        return HttpErrorType::RateLimited;
    case 401:
    case 402: // out of credits on OpenRouter
    case 403:
        return HttpErrorType::AuthError;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        if (status_code >= 400)
            return HttpErrorType::ClientError;
        return HttpErrorType::Other;
    }
}

// Transport failures, timeouts, throttling and server errors are worth another attempt.
inline bool is_retryable(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
        return true;
    return status_code == 0 || status_code == 408 || status_code == 429 || status_code >= 500;
}

inline std::string get_error_description(HttpErrorType type, int status_code, const std::string& text_snippet)
{
    switch (type)
    {
    case HttpErrorType::Timeout:
        return "Request timeout (" + (status_code > 0 ? "HTTP " + std::to_string(status_code) : text_snippet) +
               "). Increase the timeout or lower the batch size.";
    case HttpErrorType::RateLimited:
        return "Rate limited (HTTP 429): " + text_snippet;
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large - request exceeds API limits. "
               "Lower the batch size or max_chars.";
    case HttpErrorType::AuthError:
        return "Authentication failed (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::NetworkError:
        return "Network error: " + text_snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(status_code) + "): " + text_snippet;
    default:
        return "HTTP " + std::to_string(status_code) + ": " + text_snippet;
    }
}

// Keeps log lines and error messages readable when a server returns a whole HTML page.
inline std::string shorten(const std::string& text, std::size_t max_bytes = 300)
{
    if (text.size() <= max_bytes)
        return text;
    std::size_t cut = max_bytes;
    // Do not cut inside a UTF-8 sequence.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u)
        --cut;
    return text.substr(0, cut) + "...";
}

} // namespace helpers
} // namespace translate
