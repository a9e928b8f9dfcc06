#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include "uiwire.hpp"
#include "common/cli.hpp"
#include "common/counter_app.hpp"

using namespace uiwire;


/*
This example replays recorded request bodies through the counter application.
Each body is dispatched exactly like a transport would: parsed, validated, and its
events handed to the application one after another. The response (a JSON array of
actions) is printed on stdout, one response per line, or one action per line with
--pretty.

    replay_request -r requests/mount.json -r requests/increment.json --pretty
*/

static std::optional<std::string> read_body(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void print(const schema::Response& response, bool pretty) {
    if (!pretty) {
        std::cout << response.to_json() << std::endl;
        return;
    }
    if (response.empty()) {
        std::cout << "[]" << std::endl;
        return;
    }
    std::cout << "[\n";
    for (std::size_t i = 0; i < response.actions.size(); ++i) {
        std::cout << "  " << response.actions[i] << (i + 1 < response.actions.size() ? ",\n" : "\n");
    }
    std::cout << "]" << std::endl;
}


int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv, "uiwire request replay");
    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        params.dump("=== Replay parameters ===", std::cerr);
    }

    examples::CounterApp app;
    Dispatcher dispatcher;

    auto handler = [&](const std::string& session_id, SessionRoot root) {
        return app(params.session.empty() ? session_id : params.session, std::move(root));
    };

    int status = EXIT_SUCCESS;
    for (const auto& source : params.requests) {
        auto body = read_body(source);
        if (!body) {
            UW_ERROR("[REPLAY] Cannot read request body from " << source);
            status = EXIT_FAILURE;
            continue;
        }
        UW_DEBUG("[REPLAY] " << source << ": " << body->size() << " byte(s)");
        print(dispatcher.dispatch(*body, handler), params.pretty);
    }

    UW_INFO(dispatcher.telemetry());
    UW_INFO("[REPLAY] " << app.sessions() << " session(s) mounted");
    return status;
}
