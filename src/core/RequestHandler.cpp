#include "RequestHandler.hpp"
#include "../network/FetchErrors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ResponseBuilder.hpp"
#include <utility>

namespace BioVerify {

RequestHandler::RequestHandler(BioChecker& checker, Clock clock)
    : checker_(checker), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

Response RequestHandler::HandleJson(const std::string& request_body) {
    nlohmann::json data = nlohmann::json::parse(request_body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        Logger::Log(LogLevel::Warn, "Rejecting request: body is not a JSON object");
        return {400, BuildBadRequestBody()};
    }

    auto username = data.find("username");
    auto code = data.find("code");
    if (username == data.end() || code == data.end() || !username->is_string() || !code->is_string()) {
        Logger::Log(LogLevel::Warn, "Rejecting request: username and code must be strings");
        return {400, BuildBadRequestBody()};
    }
    return Handle(username->get<std::string>(), code->get<std::string>());
}

Response RequestHandler::Handle(const std::string& raw_username, const std::string& code) {
    auto request = ProfileUtil::MakeRequest(raw_username, code);
    if (!request) {
        Logger::Log(LogLevel::Warn, "Rejecting request: username and code required");
        return {400, BuildBadRequestBody()};
    }
    return Verify(*request);
}

Response RequestHandler::Verify(const ProfileRequest& request) {
    Logger::Log(LogLevel::Info, "Checking bio for @" + request.username + " with code: " + request.code);
    try {
        const bool found = checker_.CheckBio(request.username, request.code);
        const VerificationResult result{found, request.username, request.code,
                                        ProfileUtil::FormatIsoTimestamp(clock_())};
        return {200, BuildSuccessBody(result)};
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Error, "Bio check error: " + std::string(e.what()));
        return {500, BuildErrorBody(ErrorCategory(e), e.what())};
    }
}

}
