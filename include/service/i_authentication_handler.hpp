#ifndef TRAILHEAD_I_AUTHENTICATION_HANDLER_HPP
#define TRAILHEAD_I_AUTHENTICATION_HANDLER_HPP

#include <optional>
#include <string>

#include <grpcpp/support/status.h>

#include "metadata/header_set.hpp"
#include "metadata/i_header_sink.hpp"


struct Principal
{
	std::string user_id;
	std::string name;
};

struct AuthenticationResult
{
	grpc::Status status;
	std::optional<Principal> principal;

	[[nodiscard]] bool ok() const noexcept
	{
		return status.ok();
	}
};

class IAuthenticationHandler
{
public:
	virtual ~IAuthenticationHandler() = default;

	[[nodiscard]] virtual AuthenticationResult authenticate(const HeaderSet& request_metadata, IHeaderSink& sink) const = 0;
	/// Called after authenticate rejected the call.
	virtual void challenge(IHeaderSink& sink) const = 0;
};

#endif //TRAILHEAD_I_AUTHENTICATION_HANDLER_HPP
