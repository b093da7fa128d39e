/**
 * @file ingest_error.hpp
 * @brief Error taxonomy shared by every ingestion component.
 */

#ifndef UNROLL_INGEST_ERROR_HPP
#define UNROLL_INGEST_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace unroll {

/**
 * @brief Category of an ingestion failure.
 *
 * The category decides how the failure is surfaced to the client
 * (see http_status()).
 */
enum class ErrorKind {
    InvalidInput,       ///< Malformed/disallowed URL, missing or duplicate source
    ArchiveRejected,    ///< Traversal, symlink, size bomb or corrupt archive
    AcquisitionFailed,  ///< Clone subprocess exited non-zero
    AcquisitionTimeout, ///< Clone exceeded its wall-clock budget
    PayloadTooLarge,    ///< Upload stream exceeded its byte ceiling
    Internal            ///< Unexpected I/O failure on our side
};

/**
 * @brief Exception thrown by all ingestion components.
 */
class IngestError : public std::runtime_error {
public:
    IngestError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Stable lowercase identifier of an ErrorKind (e.g. "archive_rejected").
 */
std::string_view error_kind_to_string(ErrorKind kind);

/**
 * @brief HTTP status code used to surface an ErrorKind.
 *
 * InvalidInput, ArchiveRejected and AcquisitionFailed are client errors (400),
 * PayloadTooLarge is 413, AcquisitionTimeout is 504, Internal is 500.
 */
int http_status(ErrorKind kind);

} // namespace unroll

#endif // UNROLL_INGEST_ERROR_HPP
