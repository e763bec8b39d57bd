#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "sigil/log/log_config.hpp"

namespace sigil::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
    static LogConfig::LogLevel level() { return config_.global_level; }

private:
    static LogConfig config_;
};

}  // namespace sigil::log

#define SIGIL_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define SIGIL_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define SIGIL_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define SIGIL_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define SIGIL_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define SIGIL_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
