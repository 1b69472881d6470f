#include "service/bearer_authentication_handler.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"


namespace
{
	constexpr const char* const BEARER_PREFIX = "Bearer";

	constexpr const char* const AUTHENTICATED_USER_ID = "123";
	constexpr const char* const AUTHENTICATED_USER_NAME = "testuser";
}

BearerAuthenticationHandler::BearerAuthenticationHandler(std::string realm, std::string valid_token_prefix)
: realm_(std::move(realm)), valid_token_prefix_(std::move(valid_token_prefix))
{
}

std::string BearerAuthenticationHandler::challenge_value() const
{
	return std::string(BEARER_PREFIX) + " realm=\"" + realm_ + "\"";
}

std::string BearerAuthenticationHandler::challenge_value(const std::string& error) const
{
	return challenge_value() + ", error=\"" + error + "\"";
}

AuthenticationResult BearerAuthenticationHandler::authenticate(const HeaderSet& request_metadata, IHeaderSink& sink) const
{
	using namespace grpc;

	const auto& token_values = request_metadata.values(AUTH_TOKEN_KEY);
	if(token_values.empty())
	{
		sink.set_header(DIAGNOSTIC_KEY, "authentication-failed");
		sink.set_header(CHALLENGE_KEY, challenge_value());

		spdlog::info("Missing Authorization header");
		return {{StatusCode::UNAUTHENTICATED, "Missing Authorization header"}, std::nullopt};
	}

	const auto expected_prefix = std::string(BEARER_PREFIX) + " " + valid_token_prefix_;
	if(!starts_with_case_insensitive(token_values.front(), expected_prefix))
	{
		sink.set_header(DIAGNOSTIC_KEY, "invalid-token");
		sink.set_header(CHALLENGE_KEY, challenge_value("invalid_token"));

		spdlog::info("Invalid token");
		return {{StatusCode::UNAUTHENTICATED, "Invalid token"}, std::nullopt};
	}

	sink.set_header(DIAGNOSTIC_KEY, "authentication-success");

	return {Status::OK, Principal{AUTHENTICATED_USER_ID, AUTHENTICATED_USER_NAME}};
}

void BearerAuthenticationHandler::challenge(IHeaderSink& sink) const
{
	sink.set_header(DIAGNOSTIC_KEY, "challenge-initiated");
	sink.set_header(CHALLENGE_KEY, challenge_value());
}
