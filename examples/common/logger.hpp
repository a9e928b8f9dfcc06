#pragma once

#include <iostream>
#include <string>

#include "lcr/log/logger.hpp"


namespace uiwire::examples {

    // Logs go to stderr so stdout carries only the response JSON
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_output(&std::cerr);
        Logger::instance().set_level(level_from_string(log_level));
    }

} // namespace uiwire::examples
