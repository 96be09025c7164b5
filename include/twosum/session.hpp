#pragma once
#include "router.hpp"
#include "transport/transport.hpp"
#include <cstddef>

namespace twosum {

struct SessionStats {
    std::size_t records_read = 0;
    std::size_t records_skipped = 0;
    std::size_t responses_written = 0;
};

/// Read-dispatch-write loop over one transport. Each response is written
/// before the next record is read, so responses leave in arrival order.
class Session {
public:
    Session(const Router& router, ITransport& transport);

    /// Run until the input is exhausted. Undecodable records are skipped
    /// without a response. Throws McpTransportError on stream failure.
    SessionStats run();

    [[nodiscard]] const SessionStats& stats() const noexcept;

private:
    const Router& router_;
    ITransport& transport_;
    SessionStats stats_;
};

} // namespace twosum
