#pragma once

/// Umbrella header for the jsonrpc library.

#include "version.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "logging.hpp"
#include "service.hpp"
#include "router.hpp"
#include "server.hpp"
