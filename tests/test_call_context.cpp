#include <gtest/gtest.h>

#include <memory>

#include "middleware/call_context.hpp"
#include "middleware/middleware_exceptions.hpp"


namespace
{
	CallContext make_context()
	{
		return CallContext(std::make_shared<const PropagationRule>(PropagationRule::allow_all()));
	}
}

TEST(CallContext, SuccessfulLifecycle)
{
	auto context = make_context();
	EXPECT_EQ(context.state(), CallState::STARTED);

	context.handler_started();
	context.capture(HeaderSet{{"x-a", "1"}});
	context.handler_finished(grpc::Status::OK);
	EXPECT_EQ(context.state(), CallState::SUCCEEDED);
	ASSERT_TRUE(context.status().has_value());
	EXPECT_TRUE(context.status()->ok());

	context.trailers_merged();
	EXPECT_TRUE(context.is_merged());

	context.sent();
	EXPECT_EQ(context.state(), CallState::SENT);
	EXPECT_EQ(context.headers().values("x-a").front(), "1");
}

TEST(CallContext, FailedHandlerKeepsStatus)
{
	auto context = make_context();
	context.handler_started();
	context.handler_finished({grpc::StatusCode::UNAUTHENTICATED, "nope"});

	EXPECT_EQ(context.state(), CallState::FAILED);
	EXPECT_EQ(context.status()->error_code(), grpc::StatusCode::UNAUTHENTICATED);
	EXPECT_EQ(context.status()->error_message(), "nope");
}

TEST(CallContext, MergeBeforeHandlerFinishedIsRejected)
{
	auto context = make_context();
	context.handler_started();

	EXPECT_THROW(context.trailers_merged(), CallStateError);
}

TEST(CallContext, SendWithoutMergeIsRejected)
{
	auto context = make_context();
	context.handler_started();
	context.handler_finished(grpc::Status::OK);

	EXPECT_THROW(context.sent(), CallStateError);
}

TEST(CallContext, MergeHappensOnlyOnce)
{
	auto context = make_context();
	context.handler_started();
	context.handler_finished(grpc::Status::OK);
	context.trailers_merged();

	EXPECT_THROW(context.trailers_merged(), CallStateError);
}

TEST(CallContext, CancellationDiscardsHeaders)
{
	auto context = make_context();
	context.handler_started();
	context.capture(HeaderSet{{"www-authenticate", "Bearer"}});

	context.handler_cancelled();

	EXPECT_EQ(context.state(), CallState::CANCELLED);
	EXPECT_TRUE(context.headers().empty());
	EXPECT_THROW(context.trailers_merged(), CallStateError);
}

TEST(CallContext, CaptureOutsideHandlerIsRejected)
{
	auto context = make_context();

	EXPECT_THROW(context.capture(HeaderSet{{"x-a", "1"}}), CallStateError);
}
