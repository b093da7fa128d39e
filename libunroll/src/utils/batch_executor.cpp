#include "../../include/batch_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <chrono>
#include <future>

namespace unroll {

namespace {

constexpr std::string_view kTag = "BatchExecutor";
constexpr std::string_view kCancelled = "Cancelled";

IngestOutcome cancelled(std::string source) {
    return IngestOutcome{std::move(source), std::nullopt, ErrorKind::Internal, std::string(kCancelled)};
}

} // namespace

BatchExecutor::BatchExecutor(const IngestService& service, EventBus& bus, const unsigned threads)
    : service_(service), event_bus_(bus), pool_(threads) {}

IngestOutcome BatchExecutor::run_one(const std::size_t index,
                                     const IngestRequest& request,
                                     const std::stop_token& st) {
    std::string source = request.describe();
    if (st.stop_requested() || stop_flag_.load(std::memory_order_relaxed)) {
        event_bus_.publish(IngestErrorEvent{index, source, ErrorKind::Internal, std::string(kCancelled)});
        return cancelled(std::move(source));
    }
    event_bus_.publish(IngestStartEvent{index, source});

    const auto start = std::chrono::steady_clock::now();
    try {
        IngestResult result = service_.ingest(request);
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::size_t omitted = 0;
        for (const auto& f : result.files) {
            if (f.omitted()) ++omitted;
        }
        event_bus_.publish(IngestCompleteEvent{index, source, result.files.size(), omitted, duration});
        return IngestOutcome{std::move(source), std::move(result), ErrorKind::Internal, {}};
    } catch (const IngestError& e) {
        event_bus_.publish(IngestErrorEvent{index, source, e.kind(), e.what()});
        return IngestOutcome{std::move(source), std::nullopt, e.kind(), e.what()};
    }
}

std::vector<IngestOutcome> BatchExecutor::run(const std::vector<IngestRequest>& requests) {
    std::vector<std::future<IngestOutcome>> futures;
    futures.reserve(requests.size());

    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (stop_flag_.load(std::memory_order_relaxed))
            break;
        try {
            futures.push_back(pool_.enqueue([this, i, &requests](const std::stop_token& st) {
                return run_one(i, requests[i], st);
            }));
        } catch (const std::runtime_error& e) {
            Logger::log(LogLevel::Warning, std::string("Not scheduling remaining requests: ") + e.what(), kTag);
            break;
        }
    }

    std::vector<IngestOutcome> outcomes;
    outcomes.reserve(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (i >= futures.size()) {
            outcomes.push_back(cancelled(requests[i].describe()));
            continue;
        }
        try {
            outcomes.push_back(futures[i].get());
        } catch (const std::future_error&) {
            // task dropped from the queue by request_stop()
            outcomes.push_back(cancelled(requests[i].describe()));
        }
    }

    const auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                      [](const IngestOutcome& o) { return !o.ok(); });
    Logger::log(LogLevel::Info,
        "Batch finished: " + std::to_string(outcomes.size() - static_cast<std::size_t>(failed)) + " ok, "
        + std::to_string(failed) + " failed", kTag);
    return outcomes;
}

void BatchExecutor::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    pool_.request_stop();
}

} // namespace unroll
