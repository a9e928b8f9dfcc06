#pragma once

/*
===============================================================================
uiwire - Public API Entry Point
===============================================================================

Runtime core of a server-driven UI protocol:

  • codec       → typed values ⇄ path-safe symbols
  • keys        → EventKey<T> (scope-derived) / ActionKey<T> (random, flat)
  • session     → SessionRoot, Client, Ui
  • dispatcher  → request body in, ordered action list out

Applications write one handler per request event and receive a SessionRoot;
everything else is driven by the Dispatcher.
===============================================================================
*/

#include <uiwire/symbol.hpp>
#include <uiwire/scope.hpp>
#include <uiwire/config/protocol.hpp>
#include <uiwire/codec/symbol.hpp>
#include <uiwire/json/traits.hpp>
#include <uiwire/schema/request.hpp>
#include <uiwire/schema/response.hpp>
#include <uiwire/schema/mount.hpp>
#include <uiwire/session/ui.hpp>
#include <uiwire/session/client.hpp>
#include <uiwire/session/root.hpp>
#include <uiwire/key/event_key.hpp>
#include <uiwire/key/action_key.hpp>
#include <uiwire/key/path_cursor.hpp>
#include <uiwire/dispatcher.hpp>
