#pragma once
#include "json_rpc.hpp"
#include "service.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace jsonrpc {

/// Service answering a fixed set of methods by name.
/// Methods without a handler are left to the next service in the chain.
template <typename Context = NoContext>
class Router : public Service<Context> {
public:
    using Handler = std::function<nlohmann::json(Request& request, const Context& ctx)>;

    /// Register a handler for a method, replacing any previous one.
    void on(const std::string& method, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[method] = std::move(handler);
    }

    void remove(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(method);
    }

    [[nodiscard]] bool has_handler(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.count(method) > 0;
    }

    std::optional<Response> handle(Request& request, const Context& ctx) override {
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = handlers_.find(request.method());
            if (it == handlers_.end()) return std::nullopt;
            handler = it->second;
        }
        // Call handler WITHOUT holding the lock so it may register methods
        return Response::reply(request, handler(request, ctx));
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace jsonrpc
