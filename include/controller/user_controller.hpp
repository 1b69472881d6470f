#ifndef TRAILHEAD_USER_CONTROLLER_HPP
#define TRAILHEAD_USER_CONTROLLER_HPP

#include <user.grpc.pb.h>

#include "plugins/call_header_registry.hpp"
#include "service/i_authentication_handler.hpp"
#include "service/user_service.hpp"


class UserController: public trailhead::proto::User::Service
{
public:
	UserController(
			const IAuthenticationHandler& authentication_handler,
			const UserService& user_service,
			CallHeaderRegistry& header_registry
	) noexcept;

	grpc::Status get_user_info(
			grpc::ServerContext* context,
			const trailhead::proto::GetUserInfoRequest* request,
			trailhead::proto::UserInfo* response
	) override;

	grpc::Status watch_user_info(
			grpc::ServerContext* context,
			const trailhead::proto::WatchUserInfoRequest* request,
			grpc::ServerWriter<trailhead::proto::UserInfo>* writer
	) override;

private:
	const IAuthenticationHandler& authentication_handler_;
	const UserService& user_service_;
	CallHeaderRegistry& header_registry_;
};

#endif //TRAILHEAD_USER_CONTROLLER_HPP
