#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"


namespace uiwire::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn"  || value == "error" || value == "fatal" || value == "off") {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal | off";
    },
    "Log level validator"
);


struct Params {
    std::vector<std::string> requests = {"-"};  // replayed in order, "-" reads stdin
    std::string session;                        // overrides the request's sessionId when set
    std::string log_level = "warn";
    bool pretty           = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  Requests  : ";
        for (const auto& r : requests) {
            os << (r == "-" ? std::string("<stdin>") : r) << " ";
        }
        os << "\n  Session   : " << (session.empty() ? std::string("<from request>") : session)
           << "\n  Log Level : " << log_level
           << "\n  Pretty    : " << std::boolalpha << pretty << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-r,--request", params.requests, "Request body file(s), replayed in order ('-' for stdin)")->default_val(params.requests);
    app.add_option("-s,--session", params.session, "Session id override");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("-p,--pretty", params.pretty, "One action per line");

    app.footer(
        "Replays request bodies through the counter application and prints each\n"
        "response on stdout. Session state carries over between requests.\n"
        "Logs go to stderr."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace uiwire::examples::cli
