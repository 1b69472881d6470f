#include "utils/controller_utils.hpp"

#include <cassert>

#include "plugins/server_context_header_sink.hpp"


HeaderSet extract_request_metadata(const grpc::ServerContext* context)
{
	assert(context);

	return HeaderSet::from_metadata(context->client_metadata());
}

AuthenticationResult authenticate_call(
		grpc::ServerContext* context,
		const IAuthenticationHandler& authentication_handler,
		CallHeaderRegistry& header_registry
)
{
	ServerContextHeaderSink sink(context, header_registry);

	auto result = authentication_handler.authenticate(extract_request_metadata(context), sink);
	if(!result.ok())
	{
		authentication_handler.challenge(sink);
	}

	return result;
}
