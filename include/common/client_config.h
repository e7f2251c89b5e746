#pragma once

#include "common/constants.h"
#include <cstddef>
#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>

namespace fix_order_entry::common
{
    // Unreadable config file, unknown key or malformed value
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ClientConfig
    {
        // Counterparty
        std::string host = constants::DEFAULT_HOST;
        int port = constants::DEFAULT_PORT;
        std::string sender_comp_id = constants::DEFAULT_SENDER_COMP_ID;
        std::string target_comp_id = constants::DEFAULT_TARGET_COMP_ID;

        // Transport
        int connect_timeout_ms = constants::CONNECTION_TIMEOUT_MS;
        int read_timeout_ms = constants::RECV_TIMEOUT_MS;
        size_t max_response_size = constants::RESPONSE_BUFFER_SIZE;

        // Session
        int32_t initial_seq_num = constants::INITIAL_SEQUENCE_NUMBER;

        // Logging
        std::string log_level = "INFO";
        std::string log_file; // empty: console only

        // Applies one "key = value" setting. Throws ConfigError.
        void set(const std::string &key, const std::string &value);

        void validate() const;
    };

    // Layers settings onto a ClientConfig. Callers apply them in the order
    // defaults, file, environment, command line.
    class ConfigLoader
    {
    public:
        static void loadFile(const std::string &path, ClientConfig &config);
        static void load(std::istream &input, ClientConfig &config, const std::string &source = "<stream>");

        // Reads the FIX_ORDER_ENTRY_* variables that are set
        static void applyEnvironment(ClientConfig &config);

        // FIX_ORDER_ENTRY_CONFIG if set, otherwise empty
        static std::string configPathFromEnvironment();
    };

} // namespace fix_order_entry::common
