#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace BioVerify {

struct ProfileRequest {
    std::string username; // normalized handle, no '@'
    std::string code;
};

namespace ProfileUtil {

// Removes the first '@' and trims surrounding whitespace: "@Example.User " -> "Example.User".
std::string NormalizeUsername(const std::string& raw);

// std::nullopt when username or code is empty after normalization.
std::optional<ProfileRequest> MakeRequest(const std::string& raw_username, const std::string& code);

// <base_url>/@<username>, with the username percent-encoded as a path segment.
std::string BuildProfileUrl(const std::string& base_url, const std::string& username);

// UTC ISO-8601 with milliseconds, e.g. 2024-05-01T12:34:56.789Z
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

}
}
