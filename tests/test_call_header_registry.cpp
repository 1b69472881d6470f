#include <gtest/gtest.h>

#include <grpcpp/grpcpp.h>

#include "plugins/call_header_registry.hpp"


TEST(CallHeaderRegistry, UnknownCallIsNotRecorded)
{
	CallHeaderRegistry registry;
	const grpc::ServerContext context;

	EXPECT_FALSE(registry.add(&context, "x-custom-test", "1"));
	EXPECT_FALSE(registry.set(&context, "x-custom-test", "1"));
	EXPECT_TRUE(registry.take(&context).empty());
}

TEST(CallHeaderRegistry, HeadersAreKeptPerCall)
{
	CallHeaderRegistry registry;
	const grpc::ServerContext first;
	const grpc::ServerContext second;
	registry.open(&first);
	registry.open(&second);

	EXPECT_TRUE(registry.add(&first, "WWW-Authenticate", "Bearer realm=api"));
	EXPECT_TRUE(registry.add(&second, "x-custom-test", "second"));

	const auto first_headers = registry.headers(&first);
	EXPECT_EQ(first_headers.values("www-authenticate").front(), "Bearer realm=api");
	EXPECT_FALSE(first_headers.contains("x-custom-test"));
	EXPECT_EQ(registry.headers(&second).size(), 1U);
}

TEST(CallHeaderRegistry, SetReplacesRecordedValues)
{
	CallHeaderRegistry registry;
	const grpc::ServerContext context;
	registry.open(&context);

	registry.add(&context, "x-custom-test", "authentication-failed");
	registry.set(&context, "x-custom-test", "challenge-initiated");

	const auto headers = registry.headers(&context);
	ASSERT_EQ(headers.values("x-custom-test").size(), 1U);
	EXPECT_EQ(headers.values("x-custom-test").front(), "challenge-initiated");
}

TEST(CallHeaderRegistry, TakeEmptiesTheEntry)
{
	CallHeaderRegistry registry;
	const grpc::ServerContext context;
	registry.open(&context);
	registry.add(&context, "x-custom-test", "1");

	EXPECT_EQ(registry.take(&context).size(), 1U);
	EXPECT_TRUE(registry.take(&context).empty());
	EXPECT_TRUE(registry.add(&context, "x-custom-test", "2"));
}

TEST(CallHeaderRegistry, ClosedCallIsForgotten)
{
	CallHeaderRegistry registry;
	const grpc::ServerContext context;
	registry.open(&context);
	registry.add(&context, "x-custom-test", "1");

	registry.close(&context);

	EXPECT_TRUE(registry.headers(&context).empty());
	EXPECT_FALSE(registry.add(&context, "x-custom-test", "2"));
}
