#ifndef MAGENC_FETCH_ERROR_HPP
#define MAGENC_FETCH_ERROR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace magenc {
namespace fetch {

enum class FailureKind {
    TRANSPORT,
    TIMEOUT,
    HTTP_STATUS,
    INTEGRITY_MISMATCH,
    SIGNATURE_INVALID
};

inline const char* failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSPORT: return "transport";
        case FailureKind::TIMEOUT: return "timeout";
        case FailureKind::HTTP_STATUS: return "http status";
        case FailureKind::INTEGRITY_MISMATCH: return "integrity mismatch";
        case FailureKind::SIGNATURE_INVALID: return "signature invalid";
        default: return "unknown";
    }
}

// Why one candidate was rejected
struct SourceFailure {
    std::string url;
    std::string reason;
    FailureKind kind;
};

class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& message)
        : std::runtime_error(message) {}
};

class AllSourcesExhausted : public FetchError {
public:
    explicit AllSourcesExhausted(std::vector<SourceFailure> failures)
        : FetchError("Fetch: all " + std::to_string(failures.size()) + " source(s) failed")
        , failures_(std::move(failures)) {}

    const std::vector<SourceFailure>& failures() const { return failures_; }

    // True when there was at least one source and every one timed out
    bool all_timeouts() const {
        if (failures_.empty()) {
            return false;
        }
        for (const auto& failure : failures_) {
            if (failure.kind != FailureKind::TIMEOUT) {
                return false;
            }
        }
        return true;
    }

private:
    std::vector<SourceFailure> failures_;
};

class FetchCancelled : public FetchError {
public:
    FetchCancelled() : FetchError("Fetch: cancelled") {}
};

} // namespace fetch
} // namespace magenc

#endif // MAGENC_FETCH_ERROR_HPP
