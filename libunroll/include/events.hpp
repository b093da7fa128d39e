#ifndef UNROLL_EVENTS_HPP
#define UNROLL_EVENTS_HPP

#include "ingest_error.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace unroll {

/**
 * @brief Lifecycle events of a batch ingestion, published on EventBus.
 *
 * `index` is the position of the request in the batch.
 */

struct IngestStartEvent {
    std::size_t index = 0;
    std::string source;
};

struct IngestCompleteEvent {
    std::size_t index = 0;
    std::string source;
    std::size_t file_count = 0;
    std::size_t omitted_count = 0;
    std::chrono::milliseconds duration{0};
};

struct IngestErrorEvent {
    std::size_t index = 0;
    std::string source;
    ErrorKind kind = ErrorKind::Internal;
    std::string error_message;
};

} // namespace unroll

#endif // UNROLL_EVENTS_HPP
