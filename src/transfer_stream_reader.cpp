#include "linkfetch/transfer_stream_reader.hpp"

namespace linkfetch {

std::string_view toString(TransferOutcome outcome) {
    switch (outcome) {
    case TransferOutcome::Completed:
        return "completed";
    case TransferOutcome::Stalled:
        return "stalled";
    case TransferOutcome::ConnectionError:
        return "connection-error";
    case TransferOutcome::HttpError:
        return "http-error";
    case TransferOutcome::Canceled:
        return "canceled";
    case TransferOutcome::WriteError:
        return "write-error";
    case TransferOutcome::RejectedContent:
        return "rejected-content";
    }
    return "unknown";
}

} // namespace linkfetch
