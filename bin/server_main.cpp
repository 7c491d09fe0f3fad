#include <filesystem>
#include <iostream>
#include <string>

#include "respkv/core/store.hpp"
#include "respkv/net/server/server.hpp"
#include "respkv/util/config.hpp"
#include "respkv/util/logger.hpp"
#include "respkv/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        auto cli = respkv::util::Config::parse_args(argc, argv);
        if (!cli) {
            return 0;  // --help was shown
        }

        respkv::util::Config file_config;
        if (cli->config_path) {
            auto loaded = respkv::util::Config::load_file(*cli->config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << *cli->config_path
                          << std::endl;
            }
        }

        // merge: CLI > file > defaults
        auto config = respkv::util::Config::merge(file_config, *cli);

        respkv::util::Logger::instance().set_level(config.log_level);

        // lives for the whole process, nothing is persisted
        respkv::core::Store store;

        respkv::net::server::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;

        respkv::net::server::Server server(store, server_opts);

        respkv::util::SignalHandler::install();

        server.start();

        LOG_INFO("Press Ctrl+C to shutdown");

        respkv::util::SignalHandler::wait_for_shutdown();
        if (int signal = respkv::util::SignalHandler::shutdown_signal()) {
            LOG_INFO("Received " + respkv::util::signal_name(signal) + ", shutting down");
        }

        server.stop();

        LOG_INFO("Shutdown complete (" + std::to_string(store.size()) + " keys discarded)");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
