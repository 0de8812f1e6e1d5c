#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../logger/logger.hpp"

namespace Wikipath {
namespace Core {

namespace {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["start"])
            config.start = yaml["start"].as<std::string>();
        if (yaml["target"])
            config.target = yaml["target"].as<std::string>();
        if (yaml["concurrent"])
            config.concurrency = yaml["concurrent"].as<int>();
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["max_fetches"])
            config.max_fetches = yaml["max_fetches"].as<int>();
        if (yaml["prefix"])
            config.link_prefix = yaml["prefix"].as<std::string>();
        if (yaml["link_prefix"])
            config.link_prefix = yaml["link_prefix"].as<std::string>();
        if (yaml["timeout"])
            config.request_timeout = yaml["timeout"].as<int>();
        if (yaml["connect_timeout"])
            config.connect_timeout = yaml["connect_timeout"].as<int>();
        if (yaml["max_redirects"])
            config.max_redirects = yaml["max_redirects"].as<int>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();

        YAML::Node keywords = yaml["keywords"] ? yaml["keywords"] : yaml["keyword"];
        if (keywords && keywords.IsSequence()) {
            config.keywords.clear();
            for (const auto& node : keywords)
                config.keywords.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

}  // namespace

int Config::log_level() const {
    if (quiet)
        return LOG_ERROR;
    if (verbose)
        return LOG_ALL;
    return LOG_DEFAULT;
}

void Config::validate() const {
    if (concurrency < 1)
        throw std::runtime_error("concurrent must be at least 1");
    if (threads < 1)
        throw std::runtime_error("threads must be at least 1");
    if (max_fetches < 0)
        throw std::runtime_error("max_fetches must not be negative");
    if (request_timeout < 1)
        throw std::runtime_error("timeout must be at least 1 second");
    if (connect_timeout < 1)
        throw std::runtime_error("connect_timeout must be at least 1 millisecond");
    if (max_redirects < 0)
        throw std::runtime_error("max_redirects must not be negative");
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Wikipath - Concurrent shortest link path finder between two web pages"};

    app.add_option("start", config.start, "URL of the page to start from");
    app.add_option("target", config.target, "URL of the page to reach");
    app.add_option("-c,--concurrent", config.concurrency, "Number of concurrent workers");
    app.add_option("-k,--keyword", config.keywords, "Prioritize links matching keyword (repeatable, ordered)")
        ->allow_extra_args(false);
    app.add_option("-t,--threads", config.threads, "Number of IO threads");
    app.add_option("--max-fetches", config.max_fetches, "Concurrent fetch limit (0 = workers)");
    app.add_option("--prefix", config.link_prefix, "Only follow links whose href starts with this");
    app.add_option("--timeout", config.request_timeout, "Request timeout in seconds");
    app.add_option("--connect-timeout", config.connect_timeout, "Connect timeout in milliseconds");
    app.add_option("--max-redirects", config.max_redirects, "Redirects followed per fetch");
    app.add_option("--user-agent", config.user_agent, "User-Agent header");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");
    app.set_version_flag("--version", Constants::VERSION);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    config.validate();
    return config;
}

}  // namespace Core
}  // namespace Wikipath
