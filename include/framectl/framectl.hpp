/**
 * @file framectl.hpp
 * @brief Umbrella header.
 */
#pragma once
#include "framectl/core/types.hpp"
#include "framectl/core/options.hpp"
#include "framectl/core/client.hpp"
#include "framectl/core/util/error_types.hpp"
#include "framectl/core/util/logger.hpp"
#include "framectl/core/auth/auth_store.hpp"
#include "framectl/core/auth/memory_token_store.hpp"
#include "framectl/core/session/connection_session.hpp"
#include "framectl/core/rest/companion_client.hpp"
#include "framectl/commands/app_manager.hpp"
#include "framectl/commands/art_types.hpp"
#include "framectl/commands/content_controller.hpp"
#include "framectl/commands/key_codes.hpp"
#include "framectl/commands/remote_control.hpp"
#include "framectl/discovery/discovery_engine.hpp"
#include "framectl/transports/websocket/websocket_transport.hpp"
#include "framectl/transports/http/beast_http_exchange.hpp"
