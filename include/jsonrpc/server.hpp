#pragma once
#include "codec.hpp"
#include "error.hpp"
#include "json_rpc.hpp"
#include "logging.hpp"
#include "service.hpp"
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonrpc {

/// What to do with an error produced while handling a notification.
enum class NotificationErrorPolicy {
    Respond,   ///< Emit the error response with a null id
    Suppress   ///< Never respond to notifications
};

struct ServerOptions {
    NotificationErrorPolicy notification_errors = NotificationErrorPolicy::Respond;
    /// Drop the `id` member of serialized responses when it is null.
    bool omit_null_id = false;
};

namespace detail {

/// Convert an in-flight failure into an error response for the request.
Response failure_response(const Request& request, std::exception_ptr failure);

/// Decide whether a response is owed for the request.
std::optional<Response> deliver(const Request& request, Response response,
                                const ServerOptions& opts);

/// Error response for a payload that never became a request.
std::string reject_payload(const Error& e, const ServerOptions& opts);

Response method_not_found(const Request& request);

} // namespace detail

/// Dispatches requests through an ordered chain of services.
/// The first service to answer wins.
template <typename Context = NoContext>
class Server {
public:
    using Options = ServerOptions;
    using ServicePtr = std::unique_ptr<Service<Context>>;

    explicit Server(Options opts = Options{}) : opts_(opts) {}

    explicit Server(std::vector<ServicePtr> services, Options opts = Options{})
        : opts_(opts), services_(std::move(services)) {}

    // Non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = default;
    Server& operator=(Server&&) = default;

    /// Append a service to the end of the chain.
    Server& add(ServicePtr service) {
        services_.push_back(std::move(service));
        return *this;
    }

    std::size_t size() const noexcept { return services_.size(); }
    const Options& options() const noexcept { return opts_; }

    /// Call services in order and return the first response.
    /// Yields a method not found response when no service answers.
    /// Service failures propagate to the caller.
    [[nodiscard]] Response handle(Request& request, const Context& ctx) {
        for (std::size_t i = 0; i < services_.size(); ++i) {
            if (auto response = services_[i]->handle(request, ctx)) {
                LOG4CPLUS_DEBUG(logger(), "Service " << i << " answered '" << request.method() << "'");
                return std::move(*response);
            }
        }
        return detail::method_not_found(request);
    }

    /// Infallible dispatch: failures become error responses. Returns
    /// std::nullopt when no response is owed (successful notification).
    [[nodiscard]] std::optional<Response> serve(Request& request, const Context& ctx) {
        try {
            return detail::deliver(request, handle(request, ctx), opts_);
        } catch (...) {
            return detail::deliver(request,
                                   detail::failure_response(request, std::current_exception()),
                                   opts_);
        }
    }

    /// Parse, dispatch and serialize one message.
    [[nodiscard]] std::optional<std::string> serve_message(std::string_view raw, const Context& ctx) {
        std::optional<Request> request;
        try {
            request.emplace(Codec::parse(raw));
        } catch (const Error& e) {
            return detail::reject_payload(e, opts_);
        }
        auto response = serve(*request, ctx);
        if (!response) return std::nullopt;
        return Codec::serialize(*response, opts_.omit_null_id);
    }

private:
    Options opts_;
    std::vector<ServicePtr> services_;
};

/// Server for suspending services. Each service's future is resolved before
/// the next service is consulted, so at most one service runs per request.
///
/// The server, the request and the context must outlive the returned futures.
/// Temporary contexts are rejected at compile time.
template <typename Context = NoContext>
class AsyncServer {
public:
    using Options = ServerOptions;
    using ServicePtr = std::unique_ptr<AsyncService<Context>>;

    explicit AsyncServer(Options opts = Options{}) : opts_(opts) {}

    explicit AsyncServer(std::vector<ServicePtr> services, Options opts = Options{})
        : opts_(opts), services_(std::move(services)) {}

    AsyncServer(const AsyncServer&) = delete;
    AsyncServer& operator=(const AsyncServer&) = delete;
    AsyncServer(AsyncServer&&) = default;
    AsyncServer& operator=(AsyncServer&&) = default;

    AsyncServer& add(ServicePtr service) {
        services_.push_back(std::move(service));
        return *this;
    }

    std::size_t size() const noexcept { return services_.size(); }
    const Options& options() const noexcept { return opts_; }

    /// See Server::handle. Service failures are reported through the future.
    [[nodiscard]] std::future<Response> handle(Request& request, const Context& ctx) {
        return std::async(std::launch::async, [this, &request, &ctx]() {
            return run_chain(request, ctx);
        });
    }
    std::future<Response> handle(Request&, const Context&&) = delete;

    /// See Server::serve.
    [[nodiscard]] std::future<std::optional<Response>> serve(Request& request, const Context& ctx) {
        return std::async(std::launch::async, [this, &request, &ctx]() {
            return serve_now(request, ctx);
        });
    }
    std::future<std::optional<Response>> serve(Request&, const Context&&) = delete;

    /// See Server::serve_message.
    [[nodiscard]] std::future<std::optional<std::string>> serve_message(std::string raw,
                                                                        const Context& ctx) {
        return std::async(std::launch::async,
            [this, raw = std::move(raw), &ctx]() -> std::optional<std::string> {
                std::optional<Request> request;
                try {
                    request.emplace(Codec::parse(raw));
                } catch (const Error& e) {
                    return detail::reject_payload(e, opts_);
                }
                auto response = serve_now(*request, ctx);
                if (!response) return std::nullopt;
                return Codec::serialize(*response, opts_.omit_null_id);
            });
    }
    std::future<std::optional<std::string>> serve_message(std::string, const Context&&) = delete;

private:
    Response run_chain(Request& request, const Context& ctx) {
        for (std::size_t i = 0; i < services_.size(); ++i) {
            std::future<std::optional<Response>> pending = services_[i]->handle(request, ctx);
            if (auto response = pending.get()) {
                LOG4CPLUS_DEBUG(logger(), "Service " << i << " answered '" << request.method() << "'");
                return std::move(*response);
            }
        }
        return detail::method_not_found(request);
    }

    std::optional<Response> serve_now(Request& request, const Context& ctx) {
        try {
            return detail::deliver(request, run_chain(request, ctx), opts_);
        } catch (...) {
            return detail::deliver(request,
                                   detail::failure_response(request, std::current_exception()),
                                   opts_);
        }
    }

    Options opts_;
    std::vector<ServicePtr> services_;
};

} // namespace jsonrpc
