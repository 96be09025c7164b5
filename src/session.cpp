#include "twosum/session.hpp"
#include "twosum/codec.hpp"
#include "twosum/error.hpp"
#include "twosum/log.hpp"

namespace twosum {

Session::Session(const Router& router, ITransport& transport)
    : router_(router), transport_(transport) {
}

SessionStats Session::run() {
    logger()->info("Session started");

    while (auto record = transport_.read_message()) {
        ++stats_.records_read;

        JsonRpcRequest req;
        try {
            req = Codec::parse(*record);
        } catch (const McpParseError& e) {
            ++stats_.records_skipped;
            logger()->debug("Skipping undecodable record: {}", e.what());
            continue;
        }

        logger()->debug("Dispatching '{}'", req.method);
        transport_.send(Codec::serialize(router_.dispatch(req)));
        ++stats_.responses_written;
    }

    logger()->info("Session ended: {} records read, {} skipped, {} responses written",
                   stats_.records_read, stats_.records_skipped, stats_.responses_written);
    return stats_;
}

const SessionStats& Session::stats() const noexcept {
    return stats_;
}

} // namespace twosum
