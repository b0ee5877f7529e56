#pragma once
#include <chrono>
#include <functional>
#include <string>
#include "../interfaces/IProfileFetcher.hpp"

namespace BioVerify {
    struct Config;

    // Drives IProfileFetcher through a bounded number of attempts with linear
    // backoff and turns the first bio obtained into a verdict.
    class BioChecker {
    public:
        using SleepFn = std::function<void(std::chrono::milliseconds)>;

        struct RetryPolicy {
            int max_attempts = 3;
            std::chrono::milliseconds empty_backoff{2000}; // x attempt, page had no bio
            std::chrono::milliseconds error_backoff{1000}; // x attempt, fetch failed

            static RetryPolicy FromConfig(const Config& config);
        };

        // sleep defaults to std::this_thread::sleep_for.
        BioChecker(IProfileFetcher& fetcher, RetryPolicy policy, SleepFn sleep = SleepFn());

        // true/false once a bio is obtained, false if no attempt produced one.
        // Rethrows the last fetch error when the final attempt fails.
        bool CheckBio(const std::string& username, const std::string& code);

    private:
        struct AttemptOutcome;
        AttemptOutcome RunAttempt(const std::string& username);

        IProfileFetcher& fetcher_;
        RetryPolicy policy_;
        SleepFn sleep_;
    };
}
