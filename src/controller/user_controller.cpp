#include "controller/user_controller.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "mapper/user_proto_mapper.hpp"
#include "utils/controller_utils.hpp"


UserController::UserController(
		const IAuthenticationHandler& authentication_handler,
		const UserService& user_service,
		CallHeaderRegistry& header_registry
) noexcept
: authentication_handler_(authentication_handler), user_service_(user_service), header_registry_(header_registry)
{
}

grpc::Status UserController::get_user_info(
		grpc::ServerContext* context,
		const trailhead::proto::GetUserInfoRequest* request,
		trailhead::proto::UserInfo* response)
{
	using namespace grpc;

	const auto authentication = authenticate_call(context, authentication_handler_, header_registry_);
	if(!authentication.ok())
	{
		spdlog::info("get_user_info rejected: {}", authentication.status.error_message());
		return authentication.status;
	}

	spdlog::info("get_user_info called for user_id: {}", request->user_id());

	try
	{
		const auto user_info = user_service_.user_info(authentication.principal, request->user_id());
		*response = mapper::to_proto(user_info);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}

grpc::Status UserController::watch_user_info(
		grpc::ServerContext* context,
		const trailhead::proto::WatchUserInfoRequest* request,
		grpc::ServerWriter<trailhead::proto::UserInfo>* writer)
{
	using namespace grpc;

	const auto authentication = authenticate_call(context, authentication_handler_, header_registry_);
	if(!authentication.ok())
	{
		spdlog::info("watch_user_info rejected: {}", authentication.status.error_message());
		return authentication.status;
	}

	const auto count = std::max<uint32_t>(request->count(), 1);
	spdlog::info("watch_user_info called for user_id: {}, updates: {}", request->user_id(), count);

	try
	{
		const auto user_info_proto = mapper::to_proto(user_service_.user_info(authentication.principal, request->user_id()));
		for(uint32_t i = 0; i < count; ++i)
		{
			if(context->IsCancelled())
			{
				spdlog::info("watch_user_info cancelled by client after {} updates", i);
				return {StatusCode::CANCELLED, "Call cancelled"};
			}

			if(!writer->Write(user_info_proto))
			{
				spdlog::info("watch_user_info stream closed after {} updates", i);
				return {StatusCode::UNAVAILABLE, "Stream closed"};
			}
		}
	}
	catch(const std::runtime_error& error)
	{
		spdlog::error(error.what());
		return {StatusCode::INTERNAL, INTERNAL_ERROR_MSG};
	}

	return Status::OK;
}
