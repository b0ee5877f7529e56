#include "ResponseBuilder.hpp"

namespace BioVerify {

nlohmann::json BuildSuccessBody(const VerificationResult& result) {
    nlohmann::json body;
    body["success"] = true;
    body["found"] = result.found;
    body["username"] = result.username;
    body["code"] = result.code;
    body["timestamp"] = result.timestamp;
    return body;
}

nlohmann::json BuildBadRequestBody() {
    nlohmann::json body;
    body["success"] = false;
    body["error"] = "Username and code required";
    return body;
}

nlohmann::json BuildErrorBody(const std::string& category, const std::string& message) {
    nlohmann::json body;
    body["success"] = false;
    body["error"] = "Internal server error";
    body["category"] = category;
    body["message"] = message;
    return body;
}

}
