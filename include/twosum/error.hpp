#pragma once
#include <stdexcept>
#include <string>

namespace twosum {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Input record is not a decodable request envelope.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Raised by a method handler to answer with a specific JSON-RPC error code.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// Stream-level failure (oversized record, I/O fault). Ends the session.
class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class ToolNotFoundError : public McpError {
public:
    using McpError::McpError;
};

class InvalidArgumentsError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace twosum
