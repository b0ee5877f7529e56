#include <catch2/catch_all.hpp>
#include "core/RequestHandler.hpp"
#include "network/FetchErrors.hpp"

using namespace BioVerify;

namespace {

class FixedFetcher : public IProfileFetcher {
public:
    explicit FixedFetcher(std::function<std::optional<std::string>()> step) : step_(std::move(step)) {}

    std::optional<std::string> FetchBio(const std::string& username) override {
        ++calls;
        last_username = username;
        return step_();
    }

    int calls = 0;
    std::string last_username;

private:
    std::function<std::optional<std::string>()> step_;
};

std::chrono::system_clock::time_point FixedTime() {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds(1714566896789LL)};
}

BioChecker MakeChecker(IProfileFetcher& fetcher) {
    return BioChecker(fetcher, BioChecker::RetryPolicy{}, [](std::chrono::milliseconds) {});
}

}

TEST_CASE("Handle normalizes the username and reports a match") {
    FixedFetcher fetcher([] { return std::optional<std::string>("Verify: ABC123 #brand"); });
    auto checker = MakeChecker(fetcher);
    RequestHandler handler(checker, FixedTime);

    Response response = handler.Handle("@Example.User ", "abc123");

    CHECK(response.status == 200);
    CHECK(fetcher.last_username == "Example.User");
    CHECK(response.body["success"] == true);
    CHECK(response.body["found"] == true);
    CHECK(response.body["username"] == "Example.User");
    CHECK(response.body["code"] == "abc123");
    CHECK(response.body["timestamp"] == "2024-05-01T12:34:56.789Z");
}

TEST_CASE("Handle rejects requests that normalize to empty fields") {
    FixedFetcher fetcher([] { return std::optional<std::string>("bio"); });
    auto checker = MakeChecker(fetcher);
    RequestHandler handler(checker, FixedTime);

    Response response = handler.Handle(" @ ", "abc123");
    CHECK(response.status == 400);
    CHECK(response.body["success"] == false);
    CHECK(response.body["error"] == "Username and code required");
    CHECK(fetcher.calls == 0);

    CHECK(handler.Handle("user", "").status == 400);
}

TEST_CASE("HandleJson validates the request body") {
    FixedFetcher fetcher([] { return std::optional<std::string>("nothing here"); });
    auto checker = MakeChecker(fetcher);
    RequestHandler handler(checker, FixedTime);

    CHECK(handler.HandleJson("not json").status == 400);
    CHECK(handler.HandleJson("[1, 2]").status == 400);
    CHECK(handler.HandleJson(R"({"username": "someone"})").status == 400);
    CHECK(handler.HandleJson(R"({"username": 42, "code": "abc"})").status == 400);
    CHECK(fetcher.calls == 0);

    Response response = handler.HandleJson(R"({"username": "@someone", "code": "abc"})");
    CHECK(response.status == 200);
    CHECK(response.body["found"] == false);
    CHECK(response.body["username"] == "someone");
}

TEST_CASE("Terminal fetch errors become structured failures") {
    FixedFetcher fetcher([]() -> std::optional<std::string> { throw BlockedError(); });
    auto checker = MakeChecker(fetcher);
    RequestHandler handler(checker, FixedTime);

    Response response = handler.Handle("someone", "abc");

    CHECK(response.status == 500);
    CHECK(fetcher.calls == 3);
    CHECK(response.body["success"] == false);
    CHECK(response.body["error"] == "Internal server error");
    CHECK(response.body["category"] == "blocked");
    CHECK(response.body["message"] == "request blocked (403 Forbidden)");
}

TEST_CASE("Unexpected exceptions are reported as internal failures") {
    FixedFetcher fetcher([]() -> std::optional<std::string> { throw std::logic_error("unexpected"); });
    auto checker = MakeChecker(fetcher);
    RequestHandler handler(checker, FixedTime);

    Response response = handler.Handle("someone", "abc");

    CHECK(response.status == 500);
    CHECK(response.body["category"] == "internal");
    CHECK(response.body["message"] == "unexpected");
}
