#pragma once

/// Umbrella header for the toolhost library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "schema.hpp"
#include "cancellation.hpp"
#include "session.hpp"
#include "context.hpp"
#include "registry.hpp"
#include "negotiator.hpp"
#include "executor.hpp"
#include "formatter.hpp"
#include "router.hpp"
#include "sequencer.hpp"
#include "server.hpp"
#include "config.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
