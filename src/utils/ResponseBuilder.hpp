#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace BioVerify {

struct VerificationResult {
    const bool found;
    const std::string username;
    const std::string code;
    const std::string timestamp;
};

// { "success": true, "found", "username", "code", "timestamp" }
nlohmann::json BuildSuccessBody(const VerificationResult& result);

// { "success": false, "error": "Username and code required" }
nlohmann::json BuildBadRequestBody();

// { "success": false, "error": "Internal server error", "category", "message" }
nlohmann::json BuildErrorBody(const std::string& category, const std::string& message);

}
