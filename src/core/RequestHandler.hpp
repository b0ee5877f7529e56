#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "BioChecker.hpp"
#include "../utils/ProfileUtil.hpp"

namespace BioVerify {
    struct Response {
        int status = 200; // HTTP-style: 200, 400 or 500
        nlohmann::json body;
    };

    // Request boundary: validates input, runs the check and shapes the
    // response. Never lets an exception escape.
    class RequestHandler {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit RequestHandler(BioChecker& checker, Clock clock = Clock());

        // Body is a JSON object {"username": ..., "code": ...}.
        Response HandleJson(const std::string& request_body);
        Response Handle(const std::string& raw_username, const std::string& code);

    private:
        Response Verify(const ProfileRequest& request);

        BioChecker& checker_;
        Clock clock_;
    };
}
