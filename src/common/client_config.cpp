#include "common/client_config.h"
#include "utils/logger.h"
#include <cstdlib>
#include <fstream>
#include <limits>

namespace fix_order_entry::common
{
    namespace
    {
        std::string trim(const std::string &value)
        {
            size_t start = value.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
            {
                return "";
            }
            size_t end = value.find_last_not_of(" \t\r\n");
            return value.substr(start, end - start + 1);
        }

        long long parseInteger(const std::string &key, const std::string &value,
                               long long min, long long max)
        {
            std::string text = trim(value);
            size_t consumed = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(text, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigError("Invalid integer for '" + key + "': '" + value + "'");
            }
            if (consumed != text.size())
            {
                throw ConfigError("Invalid integer for '" + key + "': '" + value + "'");
            }
            if (parsed < min || parsed > max)
            {
                throw ConfigError("Value for '" + key + "' out of range: " + text);
            }
            return parsed;
        }

        void applyVariable(ClientConfig &config, const char *variable, const char *key)
        {
            const char *value = std::getenv(variable);
            if (value == nullptr)
            {
                return;
            }
            try
            {
                config.set(key, value);
            }
            catch (const ConfigError &e)
            {
                throw ConfigError(std::string(variable) + ": " + e.what());
            }
            LOG_DEBUG(std::string("Config override from ") + variable);
        }
    }

    void ClientConfig::set(const std::string &key, const std::string &value)
    {
        const long long int_max = std::numeric_limits<int32_t>::max();

        if (key == "host")
            host = trim(value);
        else if (key == "port")
            port = static_cast<int>(parseInteger(key, value, 1, 65535));
        else if (key == "sender_comp_id")
            sender_comp_id = trim(value);
        else if (key == "target_comp_id")
            target_comp_id = trim(value);
        else if (key == "connect_timeout_ms")
            connect_timeout_ms = static_cast<int>(parseInteger(key, value, 1, int_max));
        else if (key == "read_timeout_ms")
            read_timeout_ms = static_cast<int>(parseInteger(key, value, 1, int_max));
        else if (key == "max_response_size")
            max_response_size = static_cast<size_t>(parseInteger(key, value, 1, int_max));
        else if (key == "initial_seq_num")
            initial_seq_num = static_cast<int32_t>(parseInteger(key, value, 1, int_max));
        else if (key == "log_level")
            log_level = trim(value);
        else if (key == "log_file")
            log_file = trim(value);
        else
            throw ConfigError("Unknown configuration key: '" + key + "'");
    }

    void ClientConfig::validate() const
    {
        if (host.empty())
        {
            throw ConfigError("host must not be empty");
        }
        if (port <= 0 || port > 65535)
        {
            throw ConfigError("port out of range: " + std::to_string(port));
        }
        if (sender_comp_id.empty() || target_comp_id.empty())
        {
            throw ConfigError("sender_comp_id and target_comp_id must not be empty");
        }
        if (connect_timeout_ms <= 0 || read_timeout_ms <= 0)
        {
            throw ConfigError("timeouts must be positive");
        }
        if (max_response_size == 0)
        {
            throw ConfigError("max_response_size must be positive");
        }
        if (initial_seq_num < 1)
        {
            throw ConfigError("initial_seq_num must be at least 1");
        }
        try
        {
            utils::parseLogLevel(log_level);
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigError(e.what());
        }
    }

    void ConfigLoader::loadFile(const std::string &path, ClientConfig &config)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw ConfigError("Cannot open config file: " + path);
        }
        load(file, config, path);
        LOG_INFO("Loaded configuration from " + path);
    }

    void ConfigLoader::load(std::istream &input, ClientConfig &config, const std::string &source)
    {
        std::string line;
        int line_number = 0;

        while (std::getline(input, line))
        {
            line_number++;

            // Strip comments, then whitespace
            size_t hash = line.find('#');
            if (hash != std::string::npos)
            {
                line.erase(hash);
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }

            size_t eq = line.find('=');
            if (eq == std::string::npos)
            {
                throw ConfigError(source + ":" + std::to_string(line_number) + ": expected 'key = value'");
            }

            std::string key = trim(line.substr(0, eq));
            std::string value = trim(line.substr(eq + 1));
            try
            {
                config.set(key, value);
            }
            catch (const ConfigError &e)
            {
                throw ConfigError(source + ":" + std::to_string(line_number) + ": " + e.what());
            }
        }
    }

    void ConfigLoader::applyEnvironment(ClientConfig &config)
    {
        applyVariable(config, constants::ENV_HOST, "host");
        applyVariable(config, constants::ENV_PORT, "port");
        applyVariable(config, constants::ENV_SENDER, "sender_comp_id");
        applyVariable(config, constants::ENV_TARGET, "target_comp_id");
        applyVariable(config, constants::ENV_CONNECT_TIMEOUT_MS, "connect_timeout_ms");
        applyVariable(config, constants::ENV_READ_TIMEOUT_MS, "read_timeout_ms");
        applyVariable(config, constants::ENV_LOG_LEVEL, "log_level");
        applyVariable(config, constants::ENV_LOG_FILE, "log_file");
    }

    std::string ConfigLoader::configPathFromEnvironment()
    {
        const char *path = std::getenv(constants::ENV_CONFIG_FILE);
        return path ? std::string(path) : std::string();
    }

} // namespace fix_order_entry::common
