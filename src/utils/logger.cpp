#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fix_order_entry
{
    namespace utils
    {

        LogLevel parseLogLevel(const std::string &level)
        {
            std::string upper = level;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });

            if (upper == "DEBUG")
                return LogLevel::DEBUG;
            if (upper == "INFO")
                return LogLevel::INFO;
            if (upper == "WARN" || upper == "WARNING")
                return LogLevel::WARN;
            if (upper == "ERROR")
                return LogLevel::ERROR;
            if (upper == "FATAL")
                return LogLevel::FATAL;

            throw std::invalid_argument("Unknown log level: " + level);
        }

        const char *logLevelName(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARN:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::FATAL:
                return "FATAL";
            default:
                return "UNKNOWN";
            }
        }

        Logger &Logger::getInstance()
        {
            static Logger instance;
            return instance;
        }

        Logger::~Logger()
        {
            closeLogFile();
        }

        void Logger::setLogLevel(LogLevel level)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_level_ = level;
        }

        LogLevel Logger::getLogLevel() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return current_level_;
        }

        bool Logger::setLogFile(const std::string &filename)
        {
            auto stream = std::make_unique<std::ofstream>(filename, std::ios::app);
            if (!stream->is_open())
            {
                std::cerr << "Failed to open log file: " << filename << std::endl;
                return false;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            file_stream_ = std::move(stream);
            return true;
        }

        void Logger::closeLogFile()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (file_stream_)
            {
                file_stream_->close();
                file_stream_.reset();
            }
        }

        void Logger::enableConsoleOutput(bool enable)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            console_output_ = enable;
        }

        bool Logger::isEnabled(LogLevel level) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= current_level_;
        }

        void Logger::log(LogLevel level, const std::string &message)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (level < current_level_)
            {
                return;
            }

            std::string line = formatMessage(level, message);

            if (console_output_)
            {
                std::ostream &out = level >= LogLevel::ERROR ? std::cerr : std::cout;
                out << line << std::endl;
            }

            if (file_stream_)
            {
                *file_stream_ << line << std::endl;
            }
        }

        std::string Logger::formatMessage(LogLevel level, const std::string &message) const
        {
            std::ostringstream oss;
            oss << "[" << currentTimestamp() << "] ["
                << std::left << std::setw(5) << logLevelName(level) << "] "
                << message;
            return oss.str();
        }

        std::string Logger::currentTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            auto time_t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;

            std::tm local_tm{};
            localtime_r(&time_t, &local_tm);

            std::ostringstream oss;
            oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
            oss << "." << std::setfill('0') << std::setw(3) << ms.count();

            return oss.str();
        }

    } // namespace utils
} // namespace fix_order_entry
