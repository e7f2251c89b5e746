#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace fix_order_entry
{
    namespace utils
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARN = 2,
            ERROR = 3,
            FATAL = 4
        };

        // Accepts DEBUG/INFO/WARN/WARNING/ERROR/FATAL in any case; throws std::invalid_argument
        LogLevel parseLogLevel(const std::string &level);
        const char *logLevelName(LogLevel level);

        // Process-wide logger. WARN and below go to stdout, ERROR and above to
        // stderr; every enabled line is also appended to the log file if one is set.
        class Logger
        {
        public:
            static Logger &getInstance();

            // Configuration
            void setLogLevel(LogLevel level);
            LogLevel getLogLevel() const;
            bool setLogFile(const std::string &filename); // append mode
            void closeLogFile();
            void enableConsoleOutput(bool enable);

            // Logging methods
            void log(LogLevel level, const std::string &message);
            void debug(const std::string &message) { log(LogLevel::DEBUG, message); }
            void info(const std::string &message) { log(LogLevel::INFO, message); }
            void warn(const std::string &message) { log(LogLevel::WARN, message); }
            void error(const std::string &message) { log(LogLevel::ERROR, message); }
            void fatal(const std::string &message) { log(LogLevel::FATAL, message); }

            bool isEnabled(LogLevel level) const;

        private:
            Logger() = default;
            ~Logger();

            // Non-copyable, non-movable
            Logger(const Logger &) = delete;
            Logger &operator=(const Logger &) = delete;
            Logger(Logger &&) = delete;
            Logger &operator=(Logger &&) = delete;

            std::string formatMessage(LogLevel level, const std::string &message) const;
            static std::string currentTimestamp();

            LogLevel current_level_ = LogLevel::INFO;
            bool console_output_ = true;

            std::unique_ptr<std::ofstream> file_stream_;
            mutable std::mutex mutex_;
        };

// Message expressions are only evaluated when the level is enabled
#define FIX_ORDER_ENTRY_LOG(level, msg)                                                        \
    do                                                                                         \
    {                                                                                          \
        auto &fix_order_entry_logger_ = fix_order_entry::utils::Logger::getInstance();         \
        if (fix_order_entry_logger_.isEnabled(level))                                          \
        {                                                                                      \
            fix_order_entry_logger_.log(level, msg);                                           \
        }                                                                                      \
    } while (0)

#define LOG_DEBUG(msg) FIX_ORDER_ENTRY_LOG(fix_order_entry::utils::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) FIX_ORDER_ENTRY_LOG(fix_order_entry::utils::LogLevel::INFO, msg)
#define LOG_WARN(msg) FIX_ORDER_ENTRY_LOG(fix_order_entry::utils::LogLevel::WARN, msg)
#define LOG_ERROR(msg) FIX_ORDER_ENTRY_LOG(fix_order_entry::utils::LogLevel::ERROR, msg)
#define LOG_FATAL(msg) FIX_ORDER_ENTRY_LOG(fix_order_entry::utils::LogLevel::FATAL, msg)

    } // namespace utils
} // namespace fix_order_entry
