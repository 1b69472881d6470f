#include "utils/config.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include "utils/string_utils.hpp"


namespace
{
	const std::vector<std::string> DEFAULT_PROPAGATED_HEADERS = {"www-authenticate", "x-custom-test"};

	template<typename T>
	T get_value(const YAML::Node& root_node, const std::string& name)
	{
		if(const auto node = root_node[name]; node)
		{
			return node.as<T>();
		}
		spdlog::error("Failed to read node " + name);
		throw std::runtime_error("Failed to read node " + name);
	}

	template<typename T>
	T get_optional_value(const YAML::Node& root_node, const std::string& name, T default_value)
	{
		if(const auto node = root_node[name]; node)
		{
			return node.as<T>();
		}
		else
		{
			return default_value;
		}
	}

	Config::ServerConfig load_server_config(const YAML::Node& node)
	{
		Config::ServerConfig server_config;

		server_config.listen_address.hostname = get_optional_value<std::string>(node, "hostname", "0.0.0.0");
		server_config.listen_address.port = get_optional_value<uint16_t>(node, "port", 5000);

		return server_config;
	}

	Config::LoggingConfig::LogLevel map_log_level(const std::string& log_level_name)
	{
		const std::unordered_map<std::string, Config::LoggingConfig::LogLevel> level_mapping{
				{"INFO", Config::LoggingConfig::LogLevel::INFO},
				{"WARNING", Config::LoggingConfig::LogLevel::WARNING},
				{"ERROR", Config::LoggingConfig::LogLevel::ERROR},
				{"DEBUG", Config::LoggingConfig::LogLevel::DEBUG}
		};

		if(const auto level = level_mapping.find(log_level_name); level != std::end(level_mapping))
		{
			return level->second;
		}

		spdlog::error("Invalid logging level: {}", log_level_name);
		throw std::runtime_error("Invalid logging level");
	}

	Config::LoggingConfig load_logging_config(const YAML::Node& node)
	{
		Config::LoggingConfig logging_config = {};

		const auto level_string = get_value<std::string>(node, "level");
		logging_config.level = map_log_level(level_string);

		return logging_config;
	}

	PropagationRule::Mode map_propagation_mode(const std::string& mode_name)
	{
		const std::unordered_map<std::string, PropagationRule::Mode> mode_mapping{
				{"allow_all", PropagationRule::Mode::ALLOW_ALL},
				{"allow_list", PropagationRule::Mode::ALLOW_LIST},
				{"deny_list", PropagationRule::Mode::DENY_LIST}
		};

		if(const auto mode = mode_mapping.find(mode_name); mode != std::end(mode_mapping))
		{
			return mode->second;
		}

		spdlog::error("Invalid propagation mode: {}", mode_name);
		throw std::runtime_error("Invalid propagation mode");
	}

	Config::PropagationConfig load_propagation_config(const YAML::Node& node)
	{
		Config::PropagationConfig propagation_config;

		propagation_config.mode = map_propagation_mode(get_optional_value<std::string>(node, "mode", "allow_list"));

		if(const auto headers = node["headers"]; headers)
		{
			if(!headers.IsSequence())
			{
				spdlog::error("Failed to read node propagation.headers. Sequence expected");
				throw std::runtime_error("Failed to read node propagation.headers");
			}

			for(auto iter = std::cbegin(headers); iter != std::cend(headers); ++iter)
			{
				propagation_config.headers.emplace_back(trim(iter->as<std::string>()));
			}
		}

		if(propagation_config.mode == PropagationRule::Mode::ALLOW_LIST && propagation_config.headers.empty())
		{
			propagation_config.headers = DEFAULT_PROPAGATED_HEADERS;
		}

		return propagation_config;
	}

	Config::AuthenticationConfig load_authentication_config(const YAML::Node& node)
	{
		Config::AuthenticationConfig authentication_config;

		authentication_config.realm = get_optional_value<std::string>(node, "realm", "GrpcService");
		authentication_config.token_prefix = get_optional_value<std::string>(node, "token_prefix", "valid-");

		return authentication_config;
	}

	Config parse_config(const YAML::Node& root_node)
	{
		Config config;

		if(const auto node = root_node["server"]; node)
		{
			config.server = load_server_config(node);
		}
		else
		{
			spdlog::error("Failed to read node server");
			throw std::runtime_error("Failed to read node server");
		}

		if(const auto node = root_node["logging"]; node)
		{
			config.logging = load_logging_config(node);
		}
		else
		{
			config.logging = Config::LoggingConfig{
				Config::LoggingConfig::LogLevel::INFO
			};
		}

		if(const auto node = root_node["propagation"]; node)
		{
			config.propagation = load_propagation_config(node);
		}
		else
		{
			config.propagation = Config::PropagationConfig{
				PropagationRule::Mode::ALLOW_LIST,
				DEFAULT_PROPAGATED_HEADERS
			};
		}

		if(const auto node = root_node["authentication"]; node)
		{
			config.authentication = load_authentication_config(node);
		}
		else
		{
			config.authentication = load_authentication_config(YAML::Node(YAML::NodeType::Map));
		}

		return config;
	}
}

Config load_config(const std::filesystem::path& path)
{
	if(!std::filesystem::exists(path))
	{
		throw std::runtime_error("File " + path.string() + " not found");
	}

	if(!std::filesystem::is_regular_file(path))
	{
		throw std::runtime_error(path.string() + " is not a regular file");
	}

	return parse_config(YAML::LoadFile(path.string()));
}

Config load_config_from_string(const std::string& content)
{
	return parse_config(YAML::Load(content));
}

PropagationRule build_propagation_rule(const Config::PropagationConfig& config)
{
	return PropagationRule::from_mode(config.mode, config.headers);
}

void log_config(const Config& config)
{
	spdlog::info("Listen address: {}", config.server.listen_address.to_string());
	spdlog::info("Propagation mode: {}, headers: [{}]", to_string(config.propagation.mode), fmt::join(config.propagation.headers, ", "));
	spdlog::info("Authentication realm: {}", config.authentication.realm);
}
