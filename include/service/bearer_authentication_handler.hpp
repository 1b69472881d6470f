#ifndef TRAILHEAD_BEARER_AUTHENTICATION_HANDLER_HPP
#define TRAILHEAD_BEARER_AUTHENTICATION_HANDLER_HPP

#include <string>

#include "service/i_authentication_handler.hpp"


class BearerAuthenticationHandler: public IAuthenticationHandler
{
public:
	constexpr static const char* const AUTH_TOKEN_KEY = "authorization";
	constexpr static const char* const CHALLENGE_KEY = "www-authenticate";
	constexpr static const char* const DIAGNOSTIC_KEY = "x-custom-test";

	BearerAuthenticationHandler(std::string realm, std::string valid_token_prefix);

	[[nodiscard]] AuthenticationResult authenticate(const HeaderSet& request_metadata, IHeaderSink& sink) const override;
	void challenge(IHeaderSink& sink) const override;

	[[nodiscard]] std::string challenge_value() const;
	[[nodiscard]] std::string challenge_value(const std::string& error) const;

private:
	std::string realm_;
	std::string valid_token_prefix_;
};

#endif //TRAILHEAD_BEARER_AUTHENTICATION_HANDLER_HPP
