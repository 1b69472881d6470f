#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include <user.grpc.pb.h>

#include "mapper/user_proto_mapper.hpp"
#include "metadata/header_set.hpp"
#include "service/bearer_authentication_handler.hpp"


namespace
{
	constexpr const char* const DEFAULT_ADDRESS = "localhost:5000";
	constexpr const char* const DEMO_TOKEN = "Bearer valid-token-12345";
	constexpr const char* const DEMO_USER_ID = "123";

	bool make_unauthenticated_call(trailhead::proto::User::Stub& stub)
	{
		spdlog::info("Testing UNAUTHENTICATED call (expecting failure)");

		grpc::ClientContext context;
		trailhead::proto::GetUserInfoRequest request;
		trailhead::proto::UserInfo response;
		request.set_user_id(DEMO_USER_ID);

		const auto status = stub.get_user_info(&context, request, &response);
		if(status.ok())
		{
			spdlog::error("Unexpected success: user {}", response.username());
			return false;
		}

		spdlog::info("Expected failure occurred, status code: {}, message: {}", static_cast<int>(status.error_code()), status.error_message());

		const auto trailers = HeaderSet::from_metadata(context.GetServerTrailingMetadata());
		if(trailers.empty())
		{
			spdlog::warn("No trailing metadata found, header propagation is not configured");
			return false;
		}

		for(const auto& [key, values]: trailers)
		{
			for(const auto& value: values)
			{
				spdlog::info("Trailer {}: {}", key, value);
			}
		}

		bool all_found = true;
		for(const auto* key: {BearerAuthenticationHandler::CHALLENGE_KEY, BearerAuthenticationHandler::DIAGNOSTIC_KEY})
		{
			if(trailers.contains(key))
			{
				spdlog::info("Found {}: {}", key, trailers.values(key).front());
			}
			else
			{
				spdlog::error("{} NOT FOUND", key);
				all_found = false;
			}
		}

		return status.error_code() == grpc::StatusCode::UNAUTHENTICATED && all_found;
	}

	bool make_authenticated_call(trailhead::proto::User::Stub& stub)
	{
		spdlog::info("Testing AUTHENTICATED call (expecting success)");

		grpc::ClientContext context;
		context.AddMetadata(BearerAuthenticationHandler::AUTH_TOKEN_KEY, DEMO_TOKEN);

		trailhead::proto::GetUserInfoRequest request;
		trailhead::proto::UserInfo response;
		request.set_user_id(DEMO_USER_ID);

		const auto status = stub.get_user_info(&context, request, &response);
		if(!status.ok())
		{
			spdlog::error("Unexpected failure: {} - {}", static_cast<int>(status.error_code()), status.error_message());
			return false;
		}

		const auto user_info = mapper::to_model(response);
		spdlog::info("Success, user id: {}, username: {}, email: {}", user_info.user_id, user_info.username, user_info.email);

		return true;
	}
}

int main(int argc, char* argv[])
{
	const std::string address = argc > 1 ? argv[1] : DEFAULT_ADDRESS;

	const auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
	const auto stub = trailhead::proto::User::NewStub(channel);

	spdlog::info("Header to trailer demo client, server: {}", address);

	const bool unauthenticated_ok = make_unauthenticated_call(*stub);
	const bool authenticated_ok = make_authenticated_call(*stub);

	return unauthenticated_ok && authenticated_ok ? 0 : 1;
}
