#include "application/order_entry_client.h"
#include "common/client_config.h"
#include "protocol/fix_message.h"
#include "utils/logger.h"
#include "utils/performance_counters.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace fix_order_entry;

namespace
{
    constexpr int EXIT_DELIVERED = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    struct CommandLine
    {
        std::string config_path;
        std::vector<std::pair<std::string, std::string>> overrides; // config key, value
        bool async = false;
        bool help = false;
        std::vector<std::string> positional;
    };

    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program
                  << " [--config FILE] [--host H] [--port P] [--sender ID] [--target ID]\n"
                  << "       [--log-level LEVEL] [--async] SYMBOL BUY|SELL QTY PRICE\n\n"
                  << "Sends one FIX 4.2 limit NewOrderSingle and waits for a single response.\n"
                  << "Settings are applied as defaults < config file < FIX_ORDER_ENTRY_* environment\n"
                  << "< command line. Exit status: 0 delivered, 1 rejected or failed, 2 usage.\n";
    }

    CommandLine parseCommandLine(int argc, char **argv)
    {
        CommandLine cli;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto requireValue = [&](const std::string &option) -> std::string
            {
                if (i + 1 >= argc)
                {
                    throw UsageError("Missing value for " + option);
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h")
                cli.help = true;
            else if (arg == "--async")
                cli.async = true;
            else if (arg == "--config")
                cli.config_path = requireValue(arg);
            else if (arg == "--host")
                cli.overrides.emplace_back("host", requireValue(arg));
            else if (arg == "--port")
                cli.overrides.emplace_back("port", requireValue(arg));
            else if (arg == "--sender")
                cli.overrides.emplace_back("sender_comp_id", requireValue(arg));
            else if (arg == "--target")
                cli.overrides.emplace_back("target_comp_id", requireValue(arg));
            else if (arg == "--log-level")
                cli.overrides.emplace_back("log_level", requireValue(arg));
            else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0)
                throw UsageError("Unknown option " + arg);
            else
                cli.positional.push_back(arg);
        }

        if (!cli.help && cli.positional.size() != 4)
        {
            throw UsageError("Expected SYMBOL SIDE QTY PRICE, got " +
                             std::to_string(cli.positional.size()) + " argument(s)");
        }
        return cli;
    }

    common::ClientConfig resolveConfig(const CommandLine &cli)
    {
        common::ClientConfig config;

        // Explicit paths must exist; the default file is optional
        std::string path = cli.config_path;
        if (path.empty())
        {
            path = common::ConfigLoader::configPathFromEnvironment();
        }
        if (!path.empty())
        {
            common::ConfigLoader::loadFile(path, config);
        }
        else if (std::ifstream(constants::DEFAULT_CONFIG_FILE).good())
        {
            common::ConfigLoader::loadFile(constants::DEFAULT_CONFIG_FILE, config);
        }

        common::ConfigLoader::applyEnvironment(config);

        for (const auto &entry : cli.overrides)
        {
            config.set(entry.first, entry.second);
        }

        config.validate();
        return config;
    }

    void configureLogging(const common::ClientConfig &config)
    {
        auto &logger = utils::Logger::getInstance();
        logger.setLogLevel(utils::parseLogLevel(config.log_level));
        if (!config.log_file.empty() && !logger.setLogFile(config.log_file))
        {
            LOG_WARN("Logging to console only, cannot open " + config.log_file);
        }
    }

    void printEvent(const network::OrderEvent &event)
    {
        std::cout << "[" << network::eventTypeName(event.type) << "] " << event.text << std::endl;
    }

    int report(const network::SubmissionResult &result)
    {
        std::cout << "Outcome: " << network::outcomeName(result.outcome) << " - "
                  << network::describe(result.outcome) << std::endl;

        if (auto *received = std::get_if<network::Received>(&result.outcome))
        {
            protocol::FixMessage response(received->bytes);
            if (!response.empty())
            {
                std::cout << response.toFormattedString();
            }
        }

        return result.delivered() ? EXIT_DELIVERED : EXIT_FAILED;
    }

    int runSync(application::OrderEntryClient &client, const protocol::OrderRequest &order)
    {
        network::SubmissionResult result = client.submit(order);
        std::cout << "[SENT] " << protocol::FixMessageUtils::toReadable(result.message) << std::endl;
        return report(result);
    }

    int runAsync(application::OrderEntryClient &client, const protocol::OrderRequest &order)
    {
        auto future = client.submitAsync(order);

        // Show progress until the job settles
        network::OrderEvent event;
        while (future.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
        {
            while (client.pollEvent(event))
            {
                printEvent(event);
            }
        }
        client.shutdown();
        while (client.pollEvent(event))
        {
            printEvent(event);
        }

        return report(future.get());
    }
}

int main(int argc, char **argv)
{
    CommandLine cli;
    common::ClientConfig config;

    try
    {
        cli = parseCommandLine(argc, argv);
        if (cli.help)
        {
            printUsage(argv[0]);
            return EXIT_DELIVERED;
        }
        config = resolveConfig(cli);
        configureLogging(config);
    }
    catch (const UsageError &e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    catch (const common::ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    int status = EXIT_FAILED;
    try
    {
        application::OrderEntryClient client(config);
        protocol::OrderRequest order = client.makeOrder(cli.positional[0], cli.positional[1],
                                                        cli.positional[2], cli.positional[3]);

        LOG_INFO(std::string("Submitting ") + protocol::OrderRequestUtils::sideToString(order.side) +
                 " " + std::to_string(order.quantityUnits()) + " " + order.symbol + " @ " +
                 protocol::FieldEncoder::formatPrice(order.price));

        status = cli.async ? runAsync(client, order) : runSync(client, order);
    }
    catch (const protocol::ValidationError &e)
    {
        std::cerr << "Order rejected: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(std::string("Order entry failed: ") + e.what());
        return EXIT_FAILED;
    }

    if (utils::Logger::getInstance().isEnabled(utils::LogLevel::DEBUG))
    {
        utils::PerformanceCounters::getInstance().printReport("Order entry counters");
    }
    return status;
}
