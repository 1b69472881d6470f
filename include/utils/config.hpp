#ifndef TRAILHEAD_CONFIG_HPP
#define TRAILHEAD_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "address.hpp"
#include "middleware/propagation_rule.hpp"


struct Config
{
	struct ServerConfig
	{
		Address listen_address;
	};

	struct LoggingConfig
	{
		enum class LogLevel
		{
			INFO,
			WARNING,
			ERROR,
			DEBUG
		};

		LogLevel level;
	};

	struct PropagationConfig
	{
		PropagationRule::Mode mode = PropagationRule::Mode::ALLOW_LIST;
		std::vector<std::string> headers;
	};

	struct AuthenticationConfig
	{
		std::string realm;
		std::string token_prefix;
	};

	ServerConfig server;
	LoggingConfig logging;
	PropagationConfig propagation;
	AuthenticationConfig authentication;
};


Config load_config(const std::filesystem::path& path);
Config load_config_from_string(const std::string& content);

[[nodiscard]] PropagationRule build_propagation_rule(const Config::PropagationConfig& config);

void log_config(const Config& config);

#endif //TRAILHEAD_CONFIG_HPP
