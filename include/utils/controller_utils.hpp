#ifndef TRAILHEAD_CONTROLLER_UTILS_HPP
#define TRAILHEAD_CONTROLLER_UTILS_HPP

#include <grpcpp/grpcpp.h>

#include "metadata/header_set.hpp"
#include "plugins/call_header_registry.hpp"
#include "service/i_authentication_handler.hpp"


constexpr const char* const INTERNAL_ERROR_MSG = "Internal server error";

[[nodiscard]] HeaderSet extract_request_metadata(const grpc::ServerContext* context);

/// Rejected calls are challenged before returning.
[[nodiscard]] AuthenticationResult authenticate_call(
		grpc::ServerContext* context,
		const IAuthenticationHandler& authentication_handler,
		CallHeaderRegistry& header_registry
);

#endif //TRAILHEAD_CONTROLLER_UTILS_HPP
