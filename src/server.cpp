#include "jsonrpc/server.hpp"
#include "jsonrpc/codec.hpp"
#include "jsonrpc/logging.hpp"

namespace jsonrpc {
namespace detail {

Response failure_response(const Request& request, std::exception_ptr failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        LOG4CPLUS_WARN(logger(), "Service failed on '" << request.method() << "': " << e.what());
        return Response::from_error(request, e);
    } catch (...) {
        LOG4CPLUS_WARN(logger(), "Service failed on '" << request.method() << "' with a non-standard exception");
        return Response::from_error(request, InternalError("Unknown error"));
    }
}

std::optional<Response> deliver(const Request& request, Response response,
                                const ServerOptions& opts) {
    if (!request.is_notification()) return response;

    if (!response.is_error()) {
        // Successful notifications are fire-and-forget
        if (response.id().is_null()) return std::nullopt;
        return response;
    }
    if (opts.notification_errors == NotificationErrorPolicy::Suppress) {
        LOG4CPLUS_DEBUG(logger(), "Suppressed error response for notification '"
                                      << request.method() << "'");
        return std::nullopt;
    }
    return response;
}

std::string reject_payload(const Error& e, const ServerOptions& opts) {
    LOG4CPLUS_DEBUG(logger(), "Replying to unparseable payload: " << e.what());
    return Codec::serialize(Response::from_error(e), opts.omit_null_id);
}

Response method_not_found(const Request& request) {
    LOG4CPLUS_DEBUG(logger(), "No service matched '" << request.method() << "'");
    return Response::from_error(request, MethodNotFoundError(request.id(), request.method()));
}

} // namespace detail
} // namespace jsonrpc
