#pragma once

#include <cstddef>
#include <chrono>

namespace fix_order_entry
{
    namespace constants
    {

        // =============================================================================
        // NETWORK CONSTANTS
        // =============================================================================

        // Socket constants
        constexpr int INVALID_SOCKET = -1;
        constexpr size_t RESPONSE_BUFFER_SIZE = 4096; // single bounded response read

        // Network timeouts (milliseconds)
        constexpr int CONNECTION_TIMEOUT_MS = 8000; // 8 seconds
        constexpr int RECV_TIMEOUT_MS = 8000;       // 8 seconds

        // Default counterparty
        constexpr const char *DEFAULT_HOST = "127.0.0.1";
        constexpr int DEFAULT_PORT = 9876;

        // =============================================================================
        // FIX PROTOCOL CONSTANTS
        // =============================================================================

        // Price is always rendered with this many fractional digits
        constexpr int PRICE_PRECISION = 4;

        // FIX sequence numbers
        constexpr int INITIAL_SEQUENCE_NUMBER = 1;

        // Default CompIDs
        constexpr const char *DEFAULT_SENDER_COMP_ID = "CLIENT1";
        constexpr const char *DEFAULT_TARGET_COMP_ID = "SERVER1";

        // ClOrdID prefix for generated order identifiers
        constexpr const char *CL_ORD_ID_PREFIX = "ORD-";

        // =============================================================================
        // THREADING CONSTANTS
        // =============================================================================

        constexpr size_t JOB_QUEUE_SIZE = 256;
        constexpr size_t EVENT_QUEUE_SIZE = 1024;

        // =============================================================================
        // CONFIGURATION CONSTANTS
        // =============================================================================

        constexpr const char *DEFAULT_CONFIG_FILE = "config/fix_order_entry.conf";

        // Environment variables
        constexpr const char *ENV_CONFIG_FILE = "FIX_ORDER_ENTRY_CONFIG";
        constexpr const char *ENV_HOST = "FIX_ORDER_ENTRY_HOST";
        constexpr const char *ENV_PORT = "FIX_ORDER_ENTRY_PORT";
        constexpr const char *ENV_SENDER = "FIX_ORDER_ENTRY_SENDER";
        constexpr const char *ENV_TARGET = "FIX_ORDER_ENTRY_TARGET";
        constexpr const char *ENV_CONNECT_TIMEOUT_MS = "FIX_ORDER_ENTRY_CONNECT_TIMEOUT_MS";
        constexpr const char *ENV_READ_TIMEOUT_MS = "FIX_ORDER_ENTRY_READ_TIMEOUT_MS";
        constexpr const char *ENV_LOG_LEVEL = "FIX_ORDER_ENTRY_LOG_LEVEL";
        constexpr const char *ENV_LOG_FILE = "FIX_ORDER_ENTRY_LOG_FILE";

    } // namespace constants
} // namespace fix_order_entry
