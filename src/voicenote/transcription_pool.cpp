#include "transcription_pool.hpp"

#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

std::chrono::milliseconds RetryPolicy::delay_after(uint32_t attempt) const {
    if (attempt == 0) return std::chrono::milliseconds(0);
    uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
    auto delay = base_delay * (int64_t{1} << shift);
    return std::min(delay, max_delay);
}

TranscriptionPool::TranscriptionPool(AsrBackend& backend, uint32_t max_concurrent,
                                     RetryPolicy retry, Sleeper sleeper)
    : backend_(backend), max_concurrent_(std::max<uint32_t>(max_concurrent, 1)),
      retry_(retry), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    retry_.max_attempts = std::max<uint32_t>(retry_.max_attempts, 1);
}

std::vector<TranscriptionOutcome> TranscriptionPool::run(const std::vector<Segment>& segments,
                                                         const std::string& prompt) {
    std::vector<TranscriptionOutcome> outcomes(segments.size());
    if (segments.empty()) return outcomes;

    size_t worker_count = std::min<size_t>(max_concurrent_, segments.size());
    logging::info("asr", "transcribing {} segments with {} workers, up to {} attempts each",
                  segments.size(), worker_count, retry_.max_attempts);

    std::atomic<size_t> next{0};
    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back([&] {
                for (size_t i = next.fetch_add(1); i < segments.size(); i = next.fetch_add(1)) {
                    outcomes[i] = transcribe_with_retry(segments[i], prompt);
                }
            });
        }
    } // jthreads join here

    return outcomes;
}

TranscriptionOutcome TranscriptionPool::transcribe_with_retry(const Segment& segment,
                                                              const std::string& prompt) {
    TranscriptionOutcome outcome;
    outcome.index = segment.index;
    auto start = std::chrono::steady_clock::now();

    for (uint32_t attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        outcome.attempts = attempt;
        auto attempt_start = std::chrono::steady_clock::now();

        std::expected<std::string, Error> result;
        try {
            result = backend_.transcribe(segment, prompt);
        } catch (const std::exception& e) {
            result = std::unexpected(Error{ErrorKind::TranscriptionPermanent,
                                           std::string("backend threw: ") + e.what()});
        }

        double attempt_s = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - attempt_start).count();

        if (result) {
            logging::info("asr", "segment {} ok on attempt {}/{} in {:.2f}s",
                          segment.index, attempt, retry_.max_attempts, attempt_s);
            outcome.status = OutcomeStatus::Ok;
            outcome.text = std::move(*result);
            outcome.error.clear();
            break;
        }

        outcome.error = result.error().message;
        bool retryable = is_retryable(result.error());
        logging::warn("asr", "segment {} attempt {}/{} failed after {:.2f}s ({}): {}",
                      segment.index, attempt, retry_.max_attempts, attempt_s,
                      retryable ? "transient" : "permanent", outcome.error);

        if (!retryable || attempt == retry_.max_attempts) {
            logging::warn("asr", "segment {} gave up after {} attempt(s)", segment.index, attempt);
            break;
        }

        auto delay = retry_.delay_after(attempt);
        logging::info("asr", "segment {} retrying in {}ms", segment.index, delay.count());
        sleeper_(delay);
    }

    outcome.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return outcome;
}
