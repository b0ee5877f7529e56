#include "BioChecker.hpp"
#include "../utils/CodeMatcher.hpp"
#include "../utils/Logger.hpp"
#include "../../config/Config.hpp"
#include <exception>
#include <thread>
#include <utility>

namespace BioVerify {

// Result of a single fetch attempt.
struct BioChecker::AttemptOutcome {
    enum class Kind {
        Matched, // bio extracted
        Empty,   // page fetched, no bio found
        Failed   // fetch threw
    };

    Kind kind;
    std::string bio;
    std::exception_ptr error;
};

BioChecker::RetryPolicy BioChecker::RetryPolicy::FromConfig(const Config& config) {
    RetryPolicy policy;
    policy.max_attempts = config.max_attempts;
    policy.empty_backoff = std::chrono::milliseconds(config.empty_backoff_ms);
    policy.error_backoff = std::chrono::milliseconds(config.error_backoff_ms);
    return policy;
}

BioChecker::BioChecker(IProfileFetcher& fetcher, RetryPolicy policy, SleepFn sleep)
    : fetcher_(fetcher), policy_(policy), sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

BioChecker::AttemptOutcome BioChecker::RunAttempt(const std::string& username) {
    try {
        auto bio = fetcher_.FetchBio(username);
        if (bio) {
            return {AttemptOutcome::Kind::Matched, std::move(*bio), nullptr};
        }
        return {AttemptOutcome::Kind::Empty, {}, nullptr};
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Fetch for @" + username + " failed: " + e.what());
        return {AttemptOutcome::Kind::Failed, {}, std::current_exception()};
    }
}

bool BioChecker::CheckBio(const std::string& username, const std::string& code) {
    const int max_attempts = policy_.max_attempts;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        Logger::Log(LogLevel::Info, "Attempt " + std::to_string(attempt) + "/" + std::to_string(max_attempts) + " for @" + username);
        AttemptOutcome outcome = RunAttempt(username);
        const bool last_attempt = attempt == max_attempts;

        switch (outcome.kind) {
            case AttemptOutcome::Kind::Matched: {
                // A bio is final: a missing code is a negative verdict, not a reason to retry.
                const bool found = CodeMatcher::Matches(outcome.bio, code);
                Logger::Log(LogLevel::Info, "Bio text found: \"" + outcome.bio.substr(0, 100) + "\"");
                Logger::Log(LogLevel::Info, "Code \"" + code + "\" " + (found ? "FOUND" : "NOT FOUND") + " in bio");
                return found;
            }
            case AttemptOutcome::Kind::Empty:
                if (last_attempt) {
                    Logger::Log(LogLevel::Warn, "No bio extracted for @" + username + " after " + std::to_string(attempt) + " attempts");
                    return false;
                }
                sleep_(policy_.empty_backoff * attempt);
                break;
            case AttemptOutcome::Kind::Failed:
                if (last_attempt) {
                    std::rethrow_exception(outcome.error);
                }
                sleep_(policy_.error_backoff * attempt);
                break;
        }
    }
    return false;
}

}
