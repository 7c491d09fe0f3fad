#include "respkv/net/server/dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <utility>

#include "respkv/net/errors.hpp"

namespace respkv::net::server {

using core::Value;

namespace {

std::string to_upper(std::string_view str) {
    std::string upper(str);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

// shorthand form: "GET foo" sent as a plain string
Args split_words(std::string_view line) {
    Args words;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        std::size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i > start) {
            words.push_back(Value::bulk_string(std::string(line.substr(start, i - start))));
        }
    }
    return words;
}

void check_arity(const char* name, const Args& args, std::size_t expected) {
    if (args.size() != expected) {
        throw CommandError(std::string("wrong number of arguments for '") + name + "'");
    }
}

std::string key_of(const Value& arg) {
    if (!arg.is_string()) {
        throw CommandError("key must be a string");
    }
    return std::string(arg.as_string());
}

Value reply_for(std::optional<Value> stored) {
    return stored ? std::move(*stored) : Value::null();
}

}  // namespace

Dispatcher::Dispatcher(core::IStore& store) : store_(store) {
    commands_.emplace("GET", [this](const Args& args) { return get(args); });
    commands_.emplace("SET", [this](const Args& args) { return set(args); });
    commands_.emplace("DELETE", [this](const Args& args) { return remove(args); });
    commands_.emplace("FLUSH", [this](const Args& args) { return flush(args); });
    commands_.emplace("MGET", [this](const Args& args) { return mget(args); });
    commands_.emplace("MSET", [this](const Args& args) { return mset(args); });
}

Value Dispatcher::dispatch(const Value& request) {
    Args tokens;
    if (request.is_array()) {
        tokens = request.as_array();
    } else if (request.is_string()) {
        tokens = split_words(request.as_string());
    } else {
        throw CommandError("Request must be list or simple string.");
    }

    if (tokens.empty()) {
        throw CommandError("Missing command");
    }
    if (!tokens.front().is_string()) {
        throw CommandError("Command name must be a string");
    }

    std::string name = to_upper(tokens.front().as_string());
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        throw CommandError("Unrecognized command: " + name);
    }

    Args args(std::make_move_iterator(tokens.begin() + 1), std::make_move_iterator(tokens.end()));
    return it->second(args);
}

bool Dispatcher::has_command(std::string_view name) const {
    return commands_.count(to_upper(name)) > 0;
}

Value Dispatcher::get(const Args& args) {
    check_arity("GET", args, 1);
    return reply_for(store_.get(key_of(args[0])));
}

Value Dispatcher::set(const Args& args) {
    check_arity("SET", args, 2);
    store_.set(key_of(args[0]), args[1]);
    return Value::integer(1);
}

Value Dispatcher::remove(const Args& args) {
    check_arity("DELETE", args, 1);
    return Value::integer(store_.remove(key_of(args[0])) ? 1 : 0);
}

Value Dispatcher::flush(const Args& args) {
    check_arity("FLUSH", args, 0);
    return Value::integer(static_cast<int64_t>(store_.clear()));
}

Value Dispatcher::mget(const Args& args) {
    std::vector<std::string> keys;
    keys.reserve(args.size());
    for (const auto& arg : args) {
        keys.push_back(key_of(arg));
    }

    core::Array values;
    values.reserve(keys.size());
    for (auto& stored : store_.get_many(keys)) {
        values.push_back(reply_for(std::move(stored)));
    }
    return Value::array(std::move(values));
}

Value Dispatcher::mset(const Args& args) {
    if (args.size() % 2 != 0) {
        throw CommandError("MSET requires an even number of arguments");
    }

    // validate every key before touching the store so a bad key leaves it unchanged
    std::vector<std::pair<std::string, Value>> pairs;
    pairs.reserve(args.size() / 2);
    for (std::size_t i = 0; i < args.size(); i += 2) {
        pairs.emplace_back(key_of(args[i]), args[i + 1]);
    }
    return Value::integer(static_cast<int64_t>(store_.set_many(std::move(pairs))));
}

}  // namespace respkv::net::server
