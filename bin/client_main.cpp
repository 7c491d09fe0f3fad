#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "respkv/net/client/client.hpp"
#include "respkv/net/errors.hpp"

using namespace respkv::net::client;
using respkv::core::Value;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --host HOST       Server host (default: 127.0.0.1)\n"
              << "  --port PORT       Server port (default: 31337)\n"
              << "  --help            Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  SET key value     Store a value\n"
              << "  GET key           Retrieve a value\n"
              << "  DELETE key        Delete a key\n"
              << "  FLUSH             Delete all keys\n"
              << "  MGET key...       Retrieve several values\n"
              << "  MSET k v ...      Store several values\n"
              << "  QUIT              Exit client\n";
}

void print_reply(const Value& reply) {
    switch (reply.type()) {
        case respkv::core::ValueType::Null:
            std::cout << "(nil)" << std::endl;
            break;
        case respkv::core::ValueType::Integer:
            std::cout << "(integer) " << reply.as_integer() << std::endl;
            break;
        case respkv::core::ValueType::Array: {
            const auto& items = reply.as_array();
            if (items.empty()) {
                std::cout << "(empty array)" << std::endl;
            }
            for (std::size_t i = 0; i < items.size(); ++i) {
                std::cout << (i + 1) << ") ";
                if (items[i].is_string()) {
                    std::cout << items[i].as_string() << std::endl;
                } else {
                    std::cout << items[i] << std::endl;
                }
            }
            break;
        }
        case respkv::core::ValueType::SimpleString:
        case respkv::core::ValueType::BulkString:
            std::cout << reply.as_string() << std::endl;
            break;
        default:
            std::cout << reply << std::endl;
            break;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--host" && i + 1 < argc) {
                opts.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                opts.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            std::cerr << "Invalid value for " << arg << ": " << e.what() << std::endl;
            return 1;
        }
    }

    Client client(opts);

    try {
        client.connect();
        std::cout << "Connected to " << opts.host << ":" << opts.port
                  << ". Type 'exit' or 'quit' to quit." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Connection failed: " << e.what() << std::endl;
        return 1;
    }

    std::string line;
    std::cout << "> ";

    while (std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::vector<std::string> words;
        std::string word;
        while (iss >> word) {
            words.push_back(word);
        }

        if (words.empty()) {
            std::cout << "> ";
            continue;
        }

        std::string lowered = words.front();
        for (char& c : lowered) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lowered == "exit" || lowered == "quit") {
            std::cout << "Goodbye!" << std::endl;
            break;
        }

        try {
            print_reply(client.execute(words));
        } catch (const respkv::net::CommandError& e) {
            std::cout << "(error) " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cout << "ERROR " << e.what() << std::endl;

            if (!client.connected()) {
                try {
                    client.connect();
                    std::cout << "Reconnected" << std::endl;
                } catch (const std::exception& reconnect_error) {
                    std::cerr << "Reconnection failed, exiting: " << reconnect_error.what()
                              << std::endl;
                    return 1;
                }
            }
        }

        std::cout << "> ";
    }

    client.disconnect();
    return 0;
}
