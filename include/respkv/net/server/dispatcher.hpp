#ifndef RESPKV_NET_SERVER_DISPATCHER_HPP
#define RESPKV_NET_SERVER_DISPATCHER_HPP

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "respkv/core/istore.hpp"
#include "respkv/core/value.hpp"

namespace respkv::net::server {

using Args = std::vector<core::Value>;
using CommandHandler = std::function<core::Value(const Args&)>;

/*
    fixed command table: GET, SET, DELETE, FLUSH, MGET, MSET.
    each handler checks its own arity and runs against the store, which does the locking.
*/
class Dispatcher {
   public:
    explicit Dispatcher(core::IStore& store);

    // handlers capture `this`, so the table can't be copied or moved
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /*
        run one decoded request and return the reply value.
        the request is either an array (name, args...) or a string split on whitespace.
        throws CommandError for anything the client got wrong.
    */
    [[nodiscard]] core::Value dispatch(const core::Value& request);

    [[nodiscard]] bool has_command(std::string_view name) const;

   private:
    core::Value get(const Args& args);
    core::Value set(const Args& args);
    core::Value remove(const Args& args);
    core::Value flush(const Args& args);
    core::Value mget(const Args& args);
    core::Value mset(const Args& args);

    core::IStore& store_;
    std::unordered_map<std::string, CommandHandler> commands_;
};

}  // namespace respkv::net::server

#endif
