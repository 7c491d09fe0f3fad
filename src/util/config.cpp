#include "respkv/util/config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace respkv::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

uint16_t parse_port(const std::string& s) {
    int port = std::stoi(s);
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + s);
    }
    return static_cast<uint16_t>(port);
}

std::size_t parse_max_connections(const std::string& s) {
    auto n = std::stoull(s);
    if (n == 0) {
        throw std::invalid_argument("max_connections must be at least 1");
    }
    return static_cast<std::size_t>(n);
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(value);
        } else if (key == "max_connections") {
            config.max_connections = parse_max_connections(value);
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        }
    }

    return config;
}

std::optional<ConfigOverrides> Config::parse_args(int argc, char* argv[]) {
    ConfigOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE          Config file path\n"
                      << "  -H, --host HOST            Host to bind (default: 127.0.0.1)\n"
                      << "  -p, --port PORT            Port to listen on (default: 31337)\n"
                      << "  -m, --max-connections N    Max concurrent clients (default: 64)\n"
                      << "  -l, --log-level LEVEL      Log level: debug, info, warn, error, none\n"
                      << "  -h, --help                 Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            overrides.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            overrides.port = parse_port(argv[++i]);
        } else if ((arg == "-m" || arg == "--max-connections") && i + 1 < argc) {
            overrides.max_connections = parse_max_connections(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            overrides.log_level = parse_log_level(argv[++i]);
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // loaded by main before merging
            overrides.config_path = argv[++i];
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }

    return overrides;
}

Config Config::merge(const Config& file_config, const ConfigOverrides& cli) {
    // file_config already starts from the defaults
    Config result = file_config;

    if (cli.host) result.host = *cli.host;
    if (cli.port) result.port = *cli.port;
    if (cli.max_connections) result.max_connections = *cli.max_connections;
    if (cli.log_level) result.log_level = *cli.log_level;

    return result;
}

}  // namespace respkv::util
