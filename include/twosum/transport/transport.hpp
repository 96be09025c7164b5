#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace twosum {

/// Abstract record transport. Blocking and single-threaded: the session
/// alternates read_message() and send() on one thread.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Next non-empty record, without its terminator. std::nullopt once the
    /// input is exhausted. Throws McpTransportError on stream-level failure.
    virtual std::optional<std::string> read_message() = 0;

    /// Write one record and its terminator. Returns once fully written.
    /// Throws McpTransportError on failure.
    virtual void send(std::string_view record) = 0;

    /// False after end of input or a stream failure.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace twosum
