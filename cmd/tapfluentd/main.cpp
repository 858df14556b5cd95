/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <thread>

#include "DnstapInputStream.h"
#include "ErrorSink.h"
#include "handlers/fluent/FluentStreamHandler.h"
#include "outputs/fluent/FluentClient.h"
#include "tapfluent_config.h"
#include "utils.h"
#include <docopt/docopt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

static const char USAGE[] =
    R"(tapfluentd.
    Usage:
      tapfluentd [options]
      tapfluentd (-h | --help)
      tapfluentd --version

    tapfluentd receives dnstap records, anonymizes client addresses and forwards one structured event per record
    to Fluentd using the forward protocol.

    Exactly one dnstap source must be configured, either with -u, -t or -r, or in the input section of the
    --config file. Command line options override the configuration file.

    Base Options:
      -h --help                             Show this screen
      -v                                    Verbose log output
      --version                             Show version
    Configuration:
      --config FILE                         Use specified YAML configuration
    Input Options:
      -u SOCKET                             Listen for dnstap Frame Streams on the given unix socket
      -t HOST:PORT                          Listen for dnstap Frame Streams on the given TCP address
      -r FILE                               Read dnstap records from the given capture file, then exit
      -H HOSTSPEC                           Only forward records whose query or response address is in these subnets
                                            (comma separated, CIDR form). Example: "10.0.1.0/24,2001:db8::/64"
    Output Options:
      --fluent-host HOST                    Fluentd host (default: 127.0.0.1)
      --fluent-port PORT                    Fluentd forward port (default: 24224)
      --tag TAG                             Tag events are published under
      --ipv4-mask N                         IPv4 prefix length kept when anonymizing addresses (default: 24)
      --ipv6-mask N                         IPv6 prefix length kept when anonymizing addresses (default: 48)
    Logging Options:
      --log-file FILE                       Log to the given output file name
)";

namespace {
constexpr uint64_t DEFAULT_DRAIN_TIMEOUT_MS = 30000;

volatile std::sig_atomic_t shutdown_requested = 0;
void signal_handler([[maybe_unused]] int signal)
{
    shutdown_requested = 1;
}
}

using namespace tapfluent;

struct CmdOptions {
    bool verbose{false};
    std::optional<std::string> log_file;
    Config input;
    Config filter;
    Config output;
};

void fill_cmd_options(std::map<std::string, docopt::value> args, CmdOptions &options)
{
    YAML::Node config;
    YAML::Node input_config;
    YAML::Node output_config;

    auto logger = spdlog::stderr_color_mt("tapfluent");
    // local config file
    if (args["--config"]) {
        YAML::Node config_file;
        try {
            config_file = YAML::LoadFile(args["--config"].asString());

            if (!config_file.IsMap() || !config_file["tapfluent"] || !config_file["tapfluent"].IsMap()) {
                logger->error("invalid schema in config file: {}", args["--config"].asString());
                exit(EXIT_FAILURE);
            }
            if (!config_file["version"] || !config_file["version"].IsScalar() || config_file["version"].as<std::string>() != "1.0") {
                logger->error("missing or unsupported version in config file: {}", args["--config"].asString());
                exit(EXIT_FAILURE);
            }

            auto root = config_file["tapfluent"];
            if (root["config"] && root["config"].IsMap()) {
                config = root["config"];
            }
            if (root["input"]) {
                input_config = root["input"];
            }
            if (root["output"]) {
                output_config = root["output"];
            }
        } catch (std::runtime_error &e) {
            logger->error("{} in config file: {}", e.what(), args["--config"].asString());
            exit(EXIT_FAILURE);
        }
    }

    bool cli_source = args["-u"] || args["-t"] || args["-r"];
    try {
        if (input_config) {
            if (!input_config.IsMap()) {
                throw ConfigException("input section must be a map");
            }
            // a source given on the command line replaces the one in the file
            YAML::Node kept;
            for (YAML::const_iterator it = input_config.begin(); it != input_config.end(); ++it) {
                auto key = it->first.as<std::string>();
                if (cli_source && (key == "socket" || key == "tcp" || key == "dnstap_file")) {
                    continue;
                }
                if (key == "only_hosts") {
                    YAML::Node filter;
                    filter[key] = it->second;
                    options.filter.config_set_yaml(filter);
                    continue;
                }
                kept[key] = it->second;
            }
            if (kept.size()) {
                options.input.config_set_yaml(kept);
            }
        }
        if (output_config) {
            options.output.config_set_yaml(output_config);
        }
    } catch (const std::exception &e) {
        logger->error("{} in config file: {}", e.what(), args["--config"].asString());
        exit(EXIT_FAILURE);
    }

    options.verbose = (config["verbose"] && config["verbose"].as<bool>()) || args["-v"].asBool();
    if (args["--log-file"]) {
        options.log_file = args["--log-file"].asString();
    } else if (config["log_file"]) {
        options.log_file = config["log_file"].as<std::string>();
    }

    if (args["-u"]) {
        options.input.config_set("socket", args["-u"].asString());
    } else if (args["-t"]) {
        options.input.config_set("tcp", args["-t"].asString());
    } else if (args["-r"]) {
        options.input.config_set("dnstap_file", args["-r"].asString());
    }
    if (args["-H"]) {
        options.filter.config_set<Configurable::StringList>("only_hosts", lib::utils::split_str_to_vec_str(args["-H"].asString(), ','));
    }

    try {
        if (args["--fluent-host"]) {
            options.output.config_set("host", args["--fluent-host"].asString());
        }
        if (args["--fluent-port"]) {
            options.output.config_set<uint64_t>("port", static_cast<uint64_t>(args["--fluent-port"].asLong()));
        }
        if (args["--tag"]) {
            options.output.config_set("tag", args["--tag"].asString());
        }
        if (args["--ipv4-mask"]) {
            options.output.config_set<uint64_t>("ipv4_mask", static_cast<uint64_t>(args["--ipv4-mask"].asLong()));
        }
        if (args["--ipv6-mask"]) {
            options.output.config_set<uint64_t>("ipv6_mask", static_cast<uint64_t>(args["--ipv6-mask"].asLong()));
        }
    } catch (const std::invalid_argument &e) {
        logger->error("invalid numeric option: {}", e.what());
        exit(EXIT_FAILURE);
    }

    spdlog::drop("tapfluent");
}

int main(int argc, char *argv[])
{
    std::map<std::string, docopt::value> args = docopt::docopt(USAGE,
        {argv + 1, argv + argc},
        true,               // show help if requested
        TAPFLUENT_VERSION); // version string

    CmdOptions options;
    fill_cmd_options(args, options);

    std::shared_ptr<spdlog::logger> logger;
    spdlog::flush_on(spdlog::level::err);
    if (options.log_file.has_value()) {
        try {
            logger = spdlog::basic_logger_mt("tapfluent", options.log_file.value());
            spdlog::flush_every(std::chrono::seconds(3));
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log init failed: " << ex.what() << std::endl;
            exit(EXIT_FAILURE);
        }
    } else {
        logger = spdlog::stderr_color_mt("tapfluent");
    }
    if (options.verbose) {
        logger->set_level(spdlog::level::debug);
    }

    logger->info("{} starting up", TAPFLUENT_VERSION);

    input::dnstap::DnstapInputStream input{"dnstap"};
    output::fluent::FluentClient client{"fluent"};
    std::unique_ptr<ErrorSink> errors;
    std::unique_ptr<handler::fluent::FluentStreamHandler> fluent_handler;

    // input first so nothing arrives at a stopped handler, client last so buffered events get flushed
    auto shutdown = [&]() {
        input.stop();
        if (fluent_handler) {
            fluent_handler->stop();
        }
        if (errors) {
            errors->stop();
        }
        client.stop();
    };

    std::chrono::milliseconds drain_timeout{DEFAULT_DRAIN_TIMEOUT_MS};
    try {
        input.config_merge(options.input);
        client.config_merge(options.output);
        drain_timeout = std::chrono::milliseconds(options.output.config_get_or<uint64_t>("drain_timeout", DEFAULT_DRAIN_TIMEOUT_MS));

        errors = std::make_unique<ErrorSink>(options.output.config_get_or<uint64_t>("error_queue_size", ErrorSink::DEFAULT_CAPACITY));

        auto proxy = input.add_event_proxy(options.filter);
        fluent_handler = std::make_unique<handler::fluent::FluentStreamHandler>("fluent", proxy, &client, errors.get(), options.output);

        errors->start();
        client.start();
        fluent_handler->start();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // a capture file is read to the end here
        input.start();
    } catch (const std::exception &e) {
        logger->error(e.what());
        shutdown();
        logger->info("exit with failure");
        exit(EXIT_FAILURE);
    }

    if (options.input.config_exists("dnstap_file")) {
        // the whole file is buffered by now, give the client a chance to connect and send it
        if (!client.drain(drain_timeout)) {
            logger->warn("fluent output not drained after {}ms, {} bytes still buffered", drain_timeout.count(), client.pending_bytes());
        }
    } else {
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }
    }

    logger->info("Shutting down");
    logger->flush();
    shutdown();

    json j;
    client.info_json(j);
    errors->info_json(j);
    logger->info("{} dnstap records, {} skipped frames", input.records(), input.skipped());
    logger->info("fluent output: {} events accepted, {} rejected, {} discarded; {} error reports dropped",
        j["fluent"]["accepted"].get<uint64_t>(), j["fluent"]["rejected"].get<uint64_t>(),
        j["fluent"]["discarded"].get<uint64_t>(), j["errors"]["dropped"].get<uint64_t>());
    logger->flush();

    return EXIT_SUCCESS;
}
