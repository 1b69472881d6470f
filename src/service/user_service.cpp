#include "service/user_service.hpp"

#include <utility>


namespace
{
	constexpr const char* const UNKNOWN_USER_NAME = "unknown";
}

UserService::UserService(std::string email_domain)
: email_domain_(std::move(email_domain))
{
}

UserService::UserInfo UserService::user_info(const std::optional<Principal>& principal, const std::string& requested_user_id) const
{
	UserInfo info;

	info.username = principal && !principal->name.empty() ? principal->name : UNKNOWN_USER_NAME;
	info.user_id = principal && !principal->user_id.empty() ? principal->user_id : requested_user_id;
	info.email = info.username + "@" + email_domain_;

	return info;
}
