#ifndef FILESHARE_TRANSFER_TRANSFER_OUTCOME_H
#define FILESHARE_TRANSFER_TRANSFER_OUTCOME_H

#include <cstdint>
#include <string>
#include <utility>

namespace fileshare {

// How a streaming transfer ended
struct TransferOutcome {
    enum class Result {
        Completed,
        Failed,      // I/O error; message says why
        Cancelled,   // attempt superseded between chunks
        Rejected     // refused before any body byte (not found, bad range)
    };

    Result result = Result::Completed;
    uint64_t bytes = 0;
    std::string message;

    bool ok() const { return result == Result::Completed; }

    static TransferOutcome completed(uint64_t bytes) {
        return {Result::Completed, bytes, {}};
    }
    static TransferOutcome failed(uint64_t bytes, std::string message) {
        return {Result::Failed, bytes, std::move(message)};
    }
    static TransferOutcome cancelled(uint64_t bytes) {
        return {Result::Cancelled, bytes, {}};
    }
    static TransferOutcome rejected(std::string message) {
        return {Result::Rejected, 0, std::move(message)};
    }
};

inline std::string to_string(TransferOutcome::Result result) {
    switch (result) {
        case TransferOutcome::Result::Completed: return "completed";
        case TransferOutcome::Result::Failed: return "failed";
        case TransferOutcome::Result::Cancelled: return "cancelled";
        case TransferOutcome::Result::Rejected: return "rejected";
        default: return "unknown";
    }
}

} // namespace fileshare

#endif // FILESHARE_TRANSFER_TRANSFER_OUTCOME_H
