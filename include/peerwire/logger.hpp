#pragma once

#include <peerwire/common.hpp>

#include <memory>

namespace peerwire {

    enum class LogLevel : dp::u8 { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    /// Logging capability handed to the driver for its operational messages
    /// ("connects to peer via unicasting", "send a tag message to peer", ...)
    class Logger {
      public:
        virtual ~Logger() = default;

        virtual void log(LogLevel level, const dp::String &text) = 0;

        void debug(const dp::String &text) { log(LogLevel::Debug, text); }
        void info(const dp::String &text) { log(LogLevel::Info, text); }
        void warn(const dp::String &text) { log(LogLevel::Warn, text); }
        void error(const dp::String &text) { log(LogLevel::Error, text); }
    };

    /// Discards everything - the driver default
    class NullLogger : public Logger {
      public:
        void log(LogLevel, const dp::String &) override {}
    };

    /// Forwards to echo
    class EchoLogger : public Logger {
      public:
        void log(LogLevel level, const dp::String &text) override {
            switch (level) {
            case LogLevel::Debug:
                echo::debug(text.c_str());
                break;
            case LogLevel::Info:
                echo::info(text.c_str());
                break;
            case LogLevel::Warn:
                echo::warn(text.c_str());
                break;
            case LogLevel::Error:
                echo::error(text.c_str());
                break;
            }
        }
    };

    inline std::shared_ptr<Logger> null_logger() { return std::make_shared<NullLogger>(); }

    inline std::shared_ptr<Logger> echo_logger() { return std::make_shared<EchoLogger>(); }

} // namespace peerwire
