#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "uiwire.hpp"


namespace uiwire::examples {

/*
===============================================================================
 Counter application
===============================================================================

A small handler exercising the whole protocol surface:

  mount                               → root_mount with the Counter tree
  ["main","counter","increment"] n?   → count += n (default 1)
  ["main","counter","decrement"] n?   → count -= n (default 1)
  ["main","counter","reset"]          → count = 0
  ["main","history",<u32>,"restore"]  → count = history[i]

Every change emits `set_count` and re-mounts the tree (the history list grows).
Per-session state lives in the application, keyed by sessionId.
===============================================================================
*/

struct AppError {
    std::string message;
};

inline std::ostream& operator<<(std::ostream& os, const AppError& e) {
    return os << e.message;
}

template<typename E>
[[nodiscard]]
inline AppError app_error(std::string_view context, const E& cause) {
    std::ostringstream os;
    os << context << cause;
    return AppError{os.str()};
}


struct HistoryRow {
    std::int64_t value;
    EventKey<std::monostate> on_restore;
};

struct CounterView {
    std::int64_t count;
    EventKey<std::optional<std::int64_t>> on_increment;
    EventKey<std::optional<std::int64_t>> on_decrement;
    EventKey<std::monostate> on_reset;
    ActionKey<std::int64_t> set_count;
    std::vector<HistoryRow> history;
};

} // namespace uiwire::examples


namespace uiwire::json {

template<>
struct Traits<examples::HistoryRow> {
    static void write(std::string& out, const examples::HistoryRow& row) {
        out += '{';
        write_field(out, "value", row.value);
        out += ',';
        write_field(out, "onRestore", row.on_restore);
        out += '}';
    }
};

template<>
struct Traits<examples::CounterView> {
    static void write(std::string& out, const examples::CounterView& v) {
        out += R"({"type":"Counter","props":{)";
        write_field(out, "count", v.count);
        out += ',';
        write_field(out, "onIncrement", v.on_increment);
        out += ',';
        write_field(out, "onDecrement", v.on_decrement);
        out += ',';
        write_field(out, "onReset", v.on_reset);
        out += ',';
        write_field(out, "setCount", v.set_count);
        out += ',';
        write_field(out, "history", v.history);
        out += "}}";
    }
};

} // namespace uiwire::json


namespace uiwire::examples {

class CounterApp {
public:
    using Result = lcr::result<schema::Response, AppError>;

    Result operator()(const std::string& session_id, SessionRoot root) {
        auto mount = root.take_mount_event();
        if (!mount) {
            return lcr::err{app_error("mount failed: ", mount.error())};
        }

        if (mount.value()) {
            auto& session = sessions_[session_id];
            session = Session{};
            UW_INFO("[APP] Session " << session_id << " mounted"
                    << (mount.value()->token ? " (token present)" : " (anonymous)"));
            return render_(root, session);
        }

        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return lcr::err{AppError{"session " + session_id + " is not mounted"}};
        }
        Session& session = it->second;

        auto client = root.get_client();
        if (!client) {
            return lcr::err{AppError{"session root refused a client"}};
        }

        const std::int64_t before = session.count;
        if (auto r = route_(*client, session); !r) {
            return lcr::err{std::move(r).error()};
        }
        if (session.count == before) {
            client.reset();
            return std::move(root).into_response();
        }

        session.history.push_back(before);
        session.set_count.emit(session.count, *client);
        client.reset();
        return render_(root, session);
    }

    [[nodiscard]] std::size_t sessions() const noexcept { return sessions_.size(); }

private:
    struct Session {
        std::int64_t count = 0;
        std::vector<std::int64_t> history;
        ActionKey<std::int64_t> set_count = ActionKey<std::int64_t>::create().with_debug_symbol("set_count");
    };

    [[nodiscard]]
    static lcr::result<std::monostate, AppError> route_(Client& client, Session& session) {
        const Ui counter = client.ui().scope("counter");

        auto increment = counter.scope("increment").event_key<std::optional<std::int64_t>>();
        if (increment.matches(client)) {
            auto step = increment.take_data(client);
            if (!step) return lcr::err{app_error("increment: ", step.error())};
            session.count += step.value().value_or(1);
            return std::monostate{};
        }

        auto decrement = counter.scope("decrement").event_key<std::optional<std::int64_t>>();
        if (decrement.matches(client)) {
            auto step = decrement.take_data(client);
            if (!step) return lcr::err{app_error("decrement: ", step.error())};
            session.count -= step.value().value_or(1);
            return std::monostate{};
        }

        auto reset = counter.scope("reset").event_key<std::monostate>();
        if (reset.matches(client)) {
            auto done = reset.take_data(client);
            if (!done) return lcr::err{app_error("reset: ", done.error())};
            session.count = 0;
            return std::monostate{};
        }

        // ["main","history",<u32>,"restore"]
        PathCursor cur(client.incoming_path());
        if (cur.next_literal() == config::protocol::CLIENT_SCOPE_ROOT && cur.next_literal() == "history") {
            auto index = cur.next<std::uint32_t>();
            if (!index) {
                return lcr::err{app_error("history: ", index.error())};
            }
            if (index.value() >= session.history.size()) {
                return lcr::err{AppError{"history: no entry " + std::to_string(index.value())}};
            }
            auto restore = client.ui().scope("history").scope(codec::encode(index.value()))
                                 .scope("restore").event_key<std::monostate>();
            auto done = restore.take_data(client);
            if (!done) return lcr::err{app_error("restore: ", done.error())};
            session.count = session.history[index.value()];
            return std::monostate{};
        }

        return lcr::err{AppError{"no route for event path " + to_string(client.incoming_path())}};
    }

    [[nodiscard]]
    static Result render_(SessionRoot& root, const Session& session) {
        std::optional<Ui> ui;
        {
            auto client = root.get_client();
            if (!client) {
                return lcr::err{AppError{"session root refused a client"}};
            }
            ui = client->ui();
        }

        const Ui counter = ui->scope("counter");
        CounterView view{
            session.count,
            counter.scope("increment").event_key<std::optional<std::int64_t>>().with_debug_symbol("increment"),
            counter.scope("decrement").event_key<std::optional<std::int64_t>>().with_debug_symbol("decrement"),
            counter.scope("reset").event_key<std::monostate>(),
            session.set_count,
            {}
        };

        const Ui history = ui->scope("history");
        for (std::uint32_t i = 0; i < session.history.size(); ++i) {
            view.history.push_back(HistoryRow{
                session.history[i],
                history.scope(codec::encode(i)).scope("restore").event_key<std::monostate>()
            });
        }

        if (!root.set_root_ui(view)) {
            return lcr::err{AppError{"session root refused the root ui"}};
        }
        return std::move(root).into_response();
    }

private:
    std::unordered_map<std::string, Session> sessions_;
};

} // namespace uiwire::examples
