#include "mapper/user_proto_mapper.hpp"


namespace mapper
{
	trailhead::proto::UserInfo to_proto(const UserService::UserInfo& user_info)
	{
		trailhead::proto::UserInfo user_info_proto;

		user_info_proto.set_user_id(user_info.user_id);
		user_info_proto.set_username(user_info.username);
		user_info_proto.set_email(user_info.email);

		return user_info_proto;
	}

	UserService::UserInfo to_model(const trailhead::proto::UserInfo& user_info_proto)
	{
		return {
			.user_id = user_info_proto.user_id(),
			.username = user_info_proto.username(),
			.email = user_info_proto.email()
		};
	}
}
