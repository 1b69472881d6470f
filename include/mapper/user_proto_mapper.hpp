#ifndef TRAILHEAD_USER_PROTO_MAPPER_HPP
#define TRAILHEAD_USER_PROTO_MAPPER_HPP

#include <user.pb.h>

#include "service/user_service.hpp"


namespace mapper
{
	[[nodiscard]] trailhead::proto::UserInfo to_proto(const UserService::UserInfo& user_info);
	[[nodiscard]] UserService::UserInfo to_model(const trailhead::proto::UserInfo& user_info_proto);
}

#endif //TRAILHEAD_USER_PROTO_MAPPER_HPP
