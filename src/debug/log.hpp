#pragma once
#include <string>
#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include "../config/Config.hpp"

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

namespace Debug {
    constexpr const char* levelPrefix(LogLevel level) {
        switch (level) {
            case LOG: return "[LOG] ";
            case WARN: return "[WARN] ";
            case ERR: return "[ERR] ";
            case CRIT: return "[CRITICAL] ";
            case INFO: return "[INFO] ";
            case TRACE: return "[TRACE] ";
            default: break;
        }
        return "";
    }

    // stdout carries the verdict, everything else goes to stderr
    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {
        if (level == TRACE && !(g_pConfig && g_pConfig->m_config.trace_logging))
            return;

        const std::string logMsg = levelPrefix(level) + fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        std::fputs((logMsg + "\n").c_str(), stderr);
    }

    template <typename... Args>
    void die(fmt::format_string<Args...> fmt, Args&&... args) {
        const std::string logMsg = fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        std::fputs(("[ERR] " + logMsg + "\n").c_str(), stderr);
        exit(1);
    }
};
