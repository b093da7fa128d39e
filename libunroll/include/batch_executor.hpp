/**
 * @file batch_executor.hpp
 * @brief Runs several ingestions concurrently on a ThreadPool.
 */

#ifndef UNROLL_BATCH_EXECUTOR_HPP
#define UNROLL_BATCH_EXECUTOR_HPP

#include "event_bus.hpp"
#include "ingest_error.hpp"
#include "ingest_service.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace unroll {

/**
 * @brief Result of one request in a batch: either a result or an error.
 */
struct IngestOutcome {
    std::string source;
    std::optional<IngestResult> result;
    ErrorKind error_kind = ErrorKind::Internal;
    std::string error_message;

    [[nodiscard]] bool ok() const noexcept { return result.has_value(); }
};

/**
 * @brief Dispatches independent IngestRequests to a worker pool.
 *
 * @details Each request becomes one pool task calling IngestService::ingest.
 * Progress is published on the EventBus (IngestStartEvent, then either
 * IngestCompleteEvent or IngestErrorEvent). Outcomes are returned in input
 * order regardless of completion order.
 */
class BatchExecutor {
public:
    BatchExecutor(const IngestService& service,
                  EventBus& bus,
                  unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Runs every request and waits for all of them.
     *
     * Requests that never started because of request_stop() are reported
     * with ErrorKind::Internal and the message "Cancelled".
     */
    std::vector<IngestOutcome> run(const std::vector<IngestRequest>& requests);

    /**
     * @brief Drops queued requests and signals running workers.
     *
     * Safe to call from another thread or a signal handler. A clone or walk
     * already in progress finishes normally.
     */
    void request_stop();

    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

private:
    IngestOutcome run_one(std::size_t index, const IngestRequest& request, const std::stop_token& st);

    const IngestService& service_;
    EventBus& event_bus_;
    ThreadPool pool_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace unroll

#endif // UNROLL_BATCH_EXECUTOR_HPP
