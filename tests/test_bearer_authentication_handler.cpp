#include <gtest/gtest.h>

#include "service/bearer_authentication_handler.hpp"


namespace
{
	class RecordingHeaderSink: public IHeaderSink
	{
	public:
		void add_header(std::string_view key, std::string_view value) override
		{
			headers.add(key, value);
		}

		void set_header(std::string_view key, std::string_view value) override
		{
			headers.set(key, value);
		}

		HeaderSet headers;
	};

	const BearerAuthenticationHandler handler("GrpcService", "valid-");
}

TEST(BearerAuthenticationHandler, MissingTokenSetsChallenge)
{
	RecordingHeaderSink sink;

	const auto result = handler.authenticate(HeaderSet{}, sink);

	EXPECT_FALSE(result.ok());
	EXPECT_EQ(result.status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
	EXPECT_EQ(result.status.error_message(), "Missing Authorization header");
	EXPECT_FALSE(result.principal.has_value());
	EXPECT_EQ(sink.headers.values("www-authenticate").front(), "Bearer realm=\"GrpcService\"");
	EXPECT_EQ(sink.headers.values("x-custom-test").front(), "authentication-failed");
}

TEST(BearerAuthenticationHandler, InvalidTokenSetsErrorChallenge)
{
	RecordingHeaderSink sink;

	const auto result = handler.authenticate(HeaderSet{{"authorization", "Bearer expired-token"}}, sink);

	EXPECT_EQ(result.status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
	EXPECT_EQ(result.status.error_message(), "Invalid token");
	EXPECT_EQ(sink.headers.values("www-authenticate").front(), "Bearer realm=\"GrpcService\", error=\"invalid_token\"");
	EXPECT_EQ(sink.headers.values("x-custom-test").front(), "invalid-token");
}

TEST(BearerAuthenticationHandler, NonBearerSchemeIsInvalid)
{
	RecordingHeaderSink sink;

	const auto result = handler.authenticate(HeaderSet{{"authorization", "Basic dXNlcjpwYXNz"}}, sink);

	EXPECT_EQ(result.status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
	EXPECT_EQ(sink.headers.values("x-custom-test").front(), "invalid-token");
}

TEST(BearerAuthenticationHandler, ValidTokenAuthenticates)
{
	RecordingHeaderSink sink;

	const auto result = handler.authenticate(HeaderSet{{"Authorization", "bearer VALID-token-12345"}}, sink);

	ASSERT_TRUE(result.ok());
	ASSERT_TRUE(result.principal.has_value());
	EXPECT_EQ(result.principal->user_id, "123");
	EXPECT_EQ(result.principal->name, "testuser");
	EXPECT_FALSE(sink.headers.contains("www-authenticate"));
	EXPECT_EQ(sink.headers.values("x-custom-test").front(), "authentication-success");
}

TEST(BearerAuthenticationHandler, RealmIsConfigurable)
{
	const BearerAuthenticationHandler api_handler("api", "valid-");

	EXPECT_EQ(api_handler.challenge_value(), "Bearer realm=\"api\"");
	EXPECT_EQ(api_handler.challenge_value("invalid_token"), "Bearer realm=\"api\", error=\"invalid_token\"");
}

TEST(BearerAuthenticationHandler, ChallengeReplacesRejectionHeaders)
{
	RecordingHeaderSink sink;

	const auto result = handler.authenticate(HeaderSet{{"authorization", "Bearer expired-token"}}, sink);
	ASSERT_FALSE(result.ok());
	handler.challenge(sink);

	ASSERT_EQ(sink.headers.values("x-custom-test").size(), 1U);
	EXPECT_EQ(sink.headers.values("x-custom-test").front(), "challenge-initiated");
	ASSERT_EQ(sink.headers.values("www-authenticate").size(), 1U);
	EXPECT_EQ(sink.headers.values("www-authenticate").front(), "Bearer realm=\"GrpcService\"");
}
