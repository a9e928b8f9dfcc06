#pragma once

#include <string_view>


namespace uiwire::config::protocol {

/*
===============================================================================
Reserved protocol addresses
===============================================================================

Literals the renderer and the core agree on. Every reserved path is a single
segment. Application code never emits on these paths through an ActionKey;
they are written by SessionRoot and the Dispatcher only.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Incoming
// -----------------------------------------------------------------------------

// First segment of the session bootstrap event (payload: {"token": string|null})
inline constexpr std::string_view MOUNT_EVENT_SYMBOL = "root_app_ready";

// -----------------------------------------------------------------------------
// Outgoing
// -----------------------------------------------------------------------------

// Replaces the whole rendered tree (payload: opaque component reference)
inline constexpr std::string_view ROOT_MOUNT_SYMBOL = "root_mount";

// Protocol / handler error surfaced to the renderer (payload: string)
inline constexpr std::string_view ROOT_ERROR_SYMBOL = "root_error";

// -----------------------------------------------------------------------------
// Scoping
// -----------------------------------------------------------------------------

// Literal every Client scope chain starts from
inline constexpr std::string_view CLIENT_SCOPE_ROOT = "main";

// Prefix of the root_error text produced for structurally invalid requests
inline constexpr std::string_view INVALID_REQUEST_PREFIX = "Invalid request body. ";

} // namespace uiwire::config::protocol
