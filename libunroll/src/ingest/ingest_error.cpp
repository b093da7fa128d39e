#include "../../include/ingest_error.hpp"

namespace unroll {

std::string_view error_kind_to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:       return "invalid_input";
        case ErrorKind::ArchiveRejected:    return "archive_rejected";
        case ErrorKind::AcquisitionFailed:  return "acquisition_failed";
        case ErrorKind::AcquisitionTimeout: return "acquisition_timeout";
        case ErrorKind::PayloadTooLarge:    return "payload_too_large";
        case ErrorKind::Internal:           return "internal";
    }
    return "internal";
}

int http_status(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput:
        case ErrorKind::ArchiveRejected:
        case ErrorKind::AcquisitionFailed:
            return 400;
        case ErrorKind::PayloadTooLarge:
            return 413;
        case ErrorKind::AcquisitionTimeout:
            return 504;
        case ErrorKind::Internal:
            return 500;
    }
    return 500;
}

} // namespace unroll
