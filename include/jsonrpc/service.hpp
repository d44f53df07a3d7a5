#pragma once
#include "json_rpc.hpp"
#include <future>
#include <optional>
#include <variant>

namespace jsonrpc {

/// Context type for services that need no shared state.
using NoContext = std::monostate;

/// Handler component consulted by a Server.
///
/// Return std::nullopt when the request is not for this service so the
/// server tries the next one. Returning a response commits to answering.
/// Throwing reports a failure; the server converts it into an error
/// response carrying the request id.
template <typename Context = NoContext>
class Service {
public:
    virtual ~Service() = default;

    virtual std::optional<Response> handle(Request& request, const Context& ctx) = 0;
};

/// Suspending variant of Service with the same contract.
/// The returned future may also report the failure.
template <typename Context = NoContext>
class AsyncService {
public:
    virtual ~AsyncService() = default;

    virtual std::future<std::optional<Response>> handle(Request& request, const Context& ctx) = 0;
};

} // namespace jsonrpc
