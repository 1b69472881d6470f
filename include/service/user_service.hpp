#ifndef TRAILHEAD_USER_SERVICE_HPP
#define TRAILHEAD_USER_SERVICE_HPP

#include <optional>
#include <string>

#include "service/i_authentication_handler.hpp"


class UserService
{
public:
	struct UserInfo
	{
		std::string user_id;
		std::string username;
		std::string email;
	};

	explicit UserService(std::string email_domain = "example.com");

	[[nodiscard]] UserInfo user_info(const std::optional<Principal>& principal, const std::string& requested_user_id) const;

private:
	std::string email_domain_;
};

#endif //TRAILHEAD_USER_SERVICE_HPP
