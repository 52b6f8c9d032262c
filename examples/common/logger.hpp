#pragma once

#include <iostream>
#include <string>

#include "lcr/log/logger.hpp"


namespace tidewire::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Level lvl = Level::Info;
        if (!parse_level(log_level, lvl)) {
            std::cerr << "Unknown log level '" << log_level << "', using info\n";
        }
        Logger::instance().set_level(lvl);
    }

} // namespace tidewire::examples
