#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "transcription_pool.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::vector<Segment> make_segments(size_t n) {
    std::vector<Segment> segments;
    for (size_t i = 0; i < n; ++i) {
        segments.push_back(Segment{
            .index = i,
            .start_s = static_cast<double>(i) * 150.0,
            .end_s = static_cast<double>(i + 1) * 150.0,
            .path = "/tmp/segment_" + std::to_string(i) + ".wav",
        });
    }
    return segments;
}

// Records requested backoff delays instead of sleeping.
struct RecordingSleeper {
    std::mutex mutex;
    std::vector<std::chrono::milliseconds> delays;

    TranscriptionPool::Sleeper fn() {
        return [this](std::chrono::milliseconds d) {
            std::lock_guard lock(mutex);
            delays.push_back(d);
        };
    }
};

} // namespace

TEST_CASE("Retry policy", "[pool]") {
    RetryPolicy policy{.max_attempts = 5, .base_delay = 1000ms, .max_delay = 5000ms};

    REQUIRE(policy.delay_after(1) == 1000ms);
    REQUIRE(policy.delay_after(2) == 2000ms);
    REQUIRE(policy.delay_after(3) == 4000ms);
    REQUIRE(policy.delay_after(4) == 5000ms);
    REQUIRE(policy.delay_after(60) == 5000ms);
}

TEST_CASE("Transcription pool", "[pool]") {
    ScriptedBackend backend;
    RecordingSleeper sleeper;
    RetryPolicy retry{.max_attempts = 3, .base_delay = 1000ms, .max_delay = 30000ms};

    SECTION("AllSegmentsSucceedInIndexOrder") {
        TranscriptionPool pool(backend, 3, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(7), "guidance");

        REQUIRE(outcomes.size() == 7);
        for (size_t i = 0; i < outcomes.size(); ++i) {
            REQUIRE(outcomes[i].index == i);
            REQUIRE(outcomes[i].ok());
            REQUIRE(outcomes[i].text == "text " + std::to_string(i));
            REQUIRE(outcomes[i].attempts == 1);
        }
        REQUIRE(sleeper.delays.empty());
    }

    SECTION("ConcurrencyNeverExceedsCap") {
        backend.call_delay = 20ms;
        TranscriptionPool pool(backend, 2, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(8), "guidance");

        REQUIRE(outcomes.size() == 8);
        REQUIRE(backend.max_in_flight.load() <= 2);
        REQUIRE(backend.max_in_flight.load() >= 1);
    }

    SECTION("CapOfOneIsSequential") {
        backend.call_delay = 5ms;
        TranscriptionPool pool(backend, 1, retry, sleeper.fn());
        pool.run(make_segments(4), "guidance");
        REQUIRE(backend.max_in_flight.load() == 1);
    }

    SECTION("TransientFailureExhaustsAttempts") {
        backend.script = [](size_t index, int attempt) -> std::expected<std::string, Error> {
            if (index == 1) return always_transient(index, attempt);
            return "text " + std::to_string(index);
        };
        TranscriptionPool pool(backend, 2, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(3), "guidance");

        REQUIRE(backend.attempts_for(1) == 3);
        REQUIRE_FALSE(outcomes[1].ok());
        REQUIRE(outcomes[1].attempts == 3);
        REQUIRE(outcomes[1].text.empty());
        REQUIRE(outcomes[1].error == "503 service unavailable");

        REQUIRE(outcomes[0].ok());
        REQUIRE(outcomes[2].ok());
        REQUIRE(backend.attempts_for(0) == 1);
        REQUIRE(backend.attempts_for(2) == 1);

        // Exponential backoff between the three attempts.
        REQUIRE(sleeper.delays == std::vector<std::chrono::milliseconds>{1000ms, 2000ms});
    }

    SECTION("RecoversAfterTransientFailure") {
        backend.script = [](size_t index, int attempt) -> std::expected<std::string, Error> {
            if (attempt == 1) return always_transient(index, attempt);
            return "recovered";
        };
        TranscriptionPool pool(backend, 2, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(2), "guidance");

        for (const auto& o : outcomes) {
            REQUIRE(o.ok());
            REQUIRE(o.attempts == 2);
            REQUIRE(o.text == "recovered");
        }
    }

    SECTION("PermanentFailureIsNotRetried") {
        backend.script = [](size_t index, int) -> std::expected<std::string, Error> {
            if (index == 0) return std::unexpected(Error{ErrorKind::TranscriptionPermanent, "HTTP 401"});
            return "fine";
        };
        TranscriptionPool pool(backend, 2, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(2), "guidance");

        REQUIRE_FALSE(outcomes[0].ok());
        REQUIRE(outcomes[0].attempts == 1);
        REQUIRE(backend.attempts_for(0) == 1);
        REQUIRE(outcomes[1].ok());
        REQUIRE(sleeper.delays.empty());
    }

    SECTION("ThrowingBackendBecomesFailedOutcome") {
        backend.script = [](size_t index, int) -> std::expected<std::string, Error> {
            if (index == 2) throw std::runtime_error("socket exploded");
            return "fine";
        };
        TranscriptionPool pool(backend, 3, retry, sleeper.fn());
        auto outcomes = pool.run(make_segments(3), "guidance");

        REQUIRE_FALSE(outcomes[2].ok());
        REQUIRE(outcomes[2].error.find("socket exploded") != std::string::npos);
        REQUIRE(outcomes[0].ok());
        REQUIRE(outcomes[1].ok());
    }

    SECTION("PromptPassedUnchangedToEveryCall") {
        TranscriptionPool pool(backend, 3, retry, sleeper.fn());
        pool.run(make_segments(5), "fixed guidance prompt");

        REQUIRE(backend.prompts.size() == 5);
        for (const auto& p : backend.prompts) REQUIRE(p == "fixed guidance prompt");
    }

    SECTION("NoSegments") {
        TranscriptionPool pool(backend, 3, retry, sleeper.fn());
        REQUIRE(pool.run({}, "guidance").empty());
        REQUIRE(backend.max_in_flight.load() == 0);
    }
}
