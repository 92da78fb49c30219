#pragma once

// Umbrella header: include this single file to get the whole engine.

#include "streamrpc/version.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/logging.hpp"
#include "streamrpc/config.hpp"
#include "streamrpc/json_rpc.hpp"
#include "streamrpc/codec.hpp"
#include "streamrpc/session.hpp"
#include "streamrpc/negotiator.hpp"
#include "streamrpc/event.hpp"
#include "streamrpc/event_framer.hpp"
#include "streamrpc/call.hpp"
#include "streamrpc/fragment_source.hpp"
#include "streamrpc/router.hpp"
#include "streamrpc/replay.hpp"
#include "streamrpc/dispatcher.hpp"
#include "streamrpc/server.hpp"
#include "streamrpc/client.hpp"
#include "streamrpc/transport/transport.hpp"
#include "streamrpc/transport/http_transport.hpp"
