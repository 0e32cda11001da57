/**
 * @file mqttop_main.cpp
 * @brief mqttop entry point.
 *
 * Subcommands
 * -----------
 * - `run`: loads the configuration, sets up logging, builds the metrics and the
 *   discovery document, then runs the bridge until SIGINT / SIGTERM or a
 *   remote `<base>/bridge/stop`.
 * - `stop [topic]`: publishes an empty message to `<base>/bridge/stop`.
 * - `version`: prints the version.
 *
 * A second SIGINT while shutdown is in progress calls `std::_Exit(1)`.
 */
#include "mqttop_service.hpp"

#include "bridge/bridge.hpp"
#include "config/config.hpp"
#include "discovery/device.hpp"
#include "discovery/discovery.hpp"
#include "metrics/factory.hpp"
#include "mqtt/paho_client.hpp"

#include <fmt/format.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace mqttop;
using namespace mqttop::utils;

namespace
{

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown_requested.load(std::memory_order_relaxed))
    {
        std::_Exit(1);
    }
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

constexpr const char *kUsage = R"(Usage:
  mqttop run [-c path]... [-b broker] [--username u] [--password p]
             [--cert file] [--key file] [-i interval] [-D prefix|disabled]
             [--data dir] [-l level]
  mqttop stop [-c path]... [-b broker] [--username u] [--password p] [topic]
  mqttop version
)";

/// Command-line values; each one set overrides the configuration.
struct CommandLine
{
    std::string command;
    std::vector<std::filesystem::path> config_paths;
    std::optional<std::string> broker;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> cert_file;
    std::optional<std::string> key_file;
    std::optional<std::string> interval;
    std::optional<std::string> discovery;
    std::optional<std::string> data_path;
    std::optional<std::string> log_level;
    std::vector<std::string> positional;
};

CommandLine parse_command_line(int argc, char **argv)
{
    CommandLine cl;
    if (argc < 2)
    {
        throw std::invalid_argument("missing command");
    }
    cl.command = argv[1];
    for (int i = 2; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        auto value = [&]() -> std::string
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument(fmt::format("flag {} needs a value", arg));
            }
            return argv[++i];
        };

        if (arg == "-c" || arg == "--config")
            cl.config_paths.emplace_back(value());
        else if (arg == "-b" || arg == "--broker")
            cl.broker = value();
        else if (arg == "--username")
            cl.username = value();
        else if (arg == "--password")
            cl.password = value();
        else if (arg == "--cert" && cl.command == "run")
            cl.cert_file = value();
        else if (arg == "--key" && cl.command == "run")
            cl.key_file = value();
        else if ((arg == "-i" || arg == "--interval") && cl.command == "run")
            cl.interval = value();
        else if ((arg == "-D" || arg == "--discovery") && cl.command == "run")
            cl.discovery = value();
        else if (arg == "--data" && cl.command == "run")
            cl.data_path = value();
        else if ((arg == "-l" || arg == "--log") && cl.command == "run")
            cl.log_level = value();
        else if (!arg.empty() && arg.front() == '-')
            throw std::invalid_argument(fmt::format("unknown flag {}", arg));
        else
            cl.positional.emplace_back(arg);
    }
    return cl;
}

config::Config load_config(const CommandLine &cl)
{
    auto cfg = config::Config::load(cl.config_paths);
    if (cl.broker)
        cfg.mqtt.broker = *cl.broker;
    if (cl.username)
        cfg.mqtt.username = *cl.username;
    if (cl.password)
        cfg.mqtt.password = *cl.password;
    if (cl.cert_file)
        cfg.mqtt.cert_file = *cl.cert_file;
    if (cl.key_file)
        cfg.mqtt.key_file = *cl.key_file;
    if (cl.interval)
    {
        auto d = format_tools::parse_duration(*cl.interval);
        if (!d)
        {
            throw std::invalid_argument(fmt::format("invalid interval '{}'", *cl.interval));
        }
        cfg.interval = *d;
    }
    if (cl.discovery)
    {
        if (*cl.discovery == "disabled")
        {
            cfg.discovery.enabled = false;
        }
        else
        {
            cfg.discovery.enabled = true;
            cfg.discovery.prefix = *cl.discovery;
        }
    }
    if (cl.data_path)
        cfg.discovery.data_path = *cl.data_path;
    if (cl.log_level)
        cfg.log.level = *cl.log_level;
    cfg.finalize();
    return cfg;
}

bool setup_logging(const config::LogConfig &log)
{
    auto &logger = Logger::instance();
    if (auto level = Logger::parse_level(log.level))
    {
        logger.set_level(*level);
    }
    logger.set_max_queue_size(static_cast<size_t>(log.queue_size));
    // Sink failures cannot go through the sink itself.
    logger.set_write_error_callback([](const std::string &msg)
                                    { fmt::print(stderr, "mqttop: log output error: {}\n", msg); });
    const auto format = log.format == "json" ? Logger::LogFormat::Json : Logger::LogFormat::Text;
    if (log.output == "stderr")
        return logger.set_console(Logger::ConsoleStream::Stderr, format);
    if (log.output == "stdout")
        return logger.set_console(Logger::ConsoleStream::Stdout, format);
    if (log.output == "syslog")
        return logger.set_syslog("mqttop");
    return logger.set_logfile(log.output, true, format);
}

std::optional<discovery::Discovery> build_discovery(const config::Config &cfg)
{
    auto device = discovery::Device::detect();
    if (!device.is_ok())
    {
        LOGGER_ERROR("Unable to identify this device, discovery disabled: {}",
                     device.error().message());
        return std::nullopt;
    }
    auto doc = discovery::Discovery::create(cfg.discovery.options(), std::move(device).content(),
                                            discovery::Origin::current());
    if (!doc.is_ok())
    {
        LOGGER_ERROR("Unable to create discovery, discovery disabled: {}", doc.error().message());
        return std::nullopt;
    }
    return std::move(doc).content();
}

std::optional<discovery::Discovery> load_previous(const std::filesystem::path &path)
{
    std::error_code fs_ec;
    if (path.empty() || !std::filesystem::exists(path, fs_ec))
    {
        return std::nullopt;
    }
    auto old = discovery::Discovery::load(path);
    if (!old.is_ok())
    {
        LOGGER_WARN("Ignoring {}: {}", path.string(), old.error().message());
        return std::nullopt;
    }
    LOGGER_DEBUG("Loaded previous discovery from {}", path.string());
    return std::move(old).content();
}

int run_bridge(const config::Config &cfg)
{
    mqtt::PahoClient::set_trace_level(cfg.mqtt.log_level);

    auto producers = metrics::from_config(cfg);

    std::optional<discovery::Discovery> doc;
    std::optional<discovery::Discovery> previous;
    std::filesystem::path discovery_file;
    if (cfg.discovery.enabled)
    {
        doc = build_discovery(cfg);
        if (!cfg.discovery.data_path.empty())
        {
            std::error_code fs_ec;
            std::filesystem::create_directories(cfg.discovery.data_path, fs_ec);
            if (fs_ec)
            {
                LOGGER_WARN("Unable to create {}: {}", cfg.discovery.data_path, fs_ec.message());
            }
            discovery_file = std::filesystem::path(cfg.discovery.data_path) / "discovery.json";
            previous = load_previous(discovery_file);
        }
    }

    bridge::Options options;
    options.base_topic = cfg.base_topic;
    options.offline_after_errors = cfg.bridge.offline_after_errors;

    auto client = std::make_shared<mqtt::PahoClient>(cfg.mqtt.client_options());
    bridge::Bridge b(client, std::move(producers), options, std::move(doc), std::move(previous));

    LOGGER_DEBUG("MQTT broker {}", client->options().broker);
    if (auto ec = b.start())
    {
        LOGGER_ERROR("Not connected: {}", ec.message());
        return 1;
    }

    auto ready = b.ready();
    while (ready.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready)
    {
        if (g_shutdown_requested.load(std::memory_order_relaxed))
        {
            b.stop();
            return 0;
        }
    }
    if (auto ec = b.error())
    {
        LOGGER_ERROR("Bridge failed to start: {}", ec.message());
        b.stop();
        return 1;
    }

    LOGGER_INFO("Running. Send SIGINT or publish to {}/bridge/stop to stop.", cfg.base_topic);
    auto done = b.done();
    while (!g_shutdown_requested.load(std::memory_order_relaxed) &&
           done.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready)
    {
    }
    if (g_shutdown_requested.load(std::memory_order_relaxed))
    {
        LOGGER_DEBUG("Received signal");
    }
    b.stop();

    if (!discovery_file.empty() && b.discovery())
    {
        LOGGER_DEBUG("Writing discovery to {}", discovery_file.string());
        if (auto ec = b.discovery()->write(discovery_file))
        {
            LOGGER_WARN("Unable to write {}: {}", discovery_file.string(), ec.message());
        }
    }
    if (const auto dropped = Logger::instance().get_total_dropped_since_sink_switch())
    {
        LOGGER_WARN("{} log messages were dropped on a full queue", dropped);
    }
    LOGGER_INFO("Done");
    return 0;
}

int stop_bridge(const config::Config &cfg, const std::vector<std::string> &positional)
{
    auto options = cfg.mqtt.client_options();
    options.will.enabled = false;
    options.auto_reconnect = false;
    mqtt::PahoClient client(std::move(options));

    auto connect = client.connect();
    connect->wait();
    if (auto ec = connect->error())
    {
        LOGGER_ERROR("Unable to connect to {}: {}", client.options().broker, ec.message());
        return 1;
    }
    const auto topic = positional.empty() ? cfg.base_topic + "/bridge/stop" : positional.front();
    auto publish = client.publish(topic, 0, false, {});
    publish->wait();
    client.disconnect(std::chrono::milliseconds(500));
    if (auto ec = publish->error())
    {
        LOGGER_ERROR("Unable to publish to {}: {}", topic, ec.message());
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    CommandLine cl;
    try
    {
        cl = parse_command_line(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        fmt::print(stderr, "mqttop: {}\n{}", e.what(), kUsage);
        return 2;
    }

    if (cl.command == "version")
    {
        fmt::print("mqttop {}\n", platform::get_version_string());
        return 0;
    }
    if (cl.command == "help" || cl.command == "-h" || cl.command == "--help")
    {
        fmt::print("{}", kUsage);
        return 0;
    }
    if (cl.command != "run" && cl.command != "start" && cl.command != "stop")
    {
        fmt::print(stderr, "mqttop: unknown command '{}'\n{}", cl.command, kUsage);
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Logger first, then libsodium (device identity hashing).
    LifecycleGuard app_lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), crypto::GetLifecycleModule()));

    config::Config cfg;
    try
    {
        if (cl.command == "stop")
        {
            cl.log_level = "warn";
        }
        cfg = load_config(cl);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "mqttop: {}\n", e.what());
        return 1;
    }

    if (!setup_logging(cfg.log))
    {
        fmt::print(stderr, "mqttop: unable to open log output '{}'\n", cfg.log.output);
        return 1;
    }
    LOGGER_INFO("Config loaded");

    if (cl.command == "stop")
    {
        return stop_bridge(cfg, cl.positional);
    }
    return run_bridge(cfg);
}
