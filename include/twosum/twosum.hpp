#pragma once

/// Umbrella header for the two-sum MCP server library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "tool_registry.hpp"
#include "tools/two_sum.hpp"
#include "router.hpp"
#include "session.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
