#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "utils/config.hpp"

#include "middleware/header_to_trailer_middleware.hpp"
#include "middleware/middleware_exceptions.hpp"
#include "plugins/call_header_registry.hpp"
#include "plugins/header_to_trailer_interceptor.hpp"

#include "service/bearer_authentication_handler.hpp"
#include "service/user_service.hpp"

#include "controller/user_controller.hpp"


namespace
{
	constexpr const char* const DEFAULT_CONFIG_PATH = "./trailhead.yaml";
}

void init_global_logger(const Config::LoggingConfig& config)
{
	using enum Config::LoggingConfig::LogLevel;

	const std::unordered_map<Config::LoggingConfig::LogLevel, spdlog::level::level_enum> spdlog_log_level_map{
		{INFO, spdlog::level::level_enum::info},
		{WARNING, spdlog::level::level_enum::warn},
		{ERROR, spdlog::level::level_enum::err},
		{DEBUG, spdlog::level::level_enum::debug}
	};

	const auto spdlog_level = spdlog_log_level_map.at(config.level);
	spdlog::set_level(spdlog_level);
	spdlog::info("Logger set up to: {} level", spdlog::level::to_short_c_str(spdlog_level));
}

std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> build_interceptor_creators(
		const Config::PropagationConfig& config,
		const std::shared_ptr<CallHeaderRegistry>& registry
)
{
	auto middleware = std::make_shared<const HeaderToTrailerMiddleware>(build_propagation_rule(config));

	std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> creators;
	creators.emplace_back(std::make_unique<HeaderToTrailerInterceptorFactory>(std::move(middleware), registry));

	return creators;
}

int main(int argc, char* argv[])
{
	const std::string config_path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

	Config config;
	try
	{
		config = load_config(config_path);
	}
	catch(const std::runtime_error& error)
	{
		spdlog::critical("Failed to load configuration {}: {}", config_path, error.what());
		return 1;
	}

	init_global_logger(config.logging);
	log_config(config);

	const std::string address = config.server.listen_address.to_string();

	BearerAuthenticationHandler authentication_handler(config.authentication.realm, config.authentication.token_prefix);
	UserService user_service;
	const auto header_registry = std::make_shared<CallHeaderRegistry>();

	grpc::ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials());

	try
	{
		builder.experimental().SetInterceptorCreators(build_interceptor_creators(config.propagation, header_registry));
	}
	catch(const ConfigurationError& error)
	{
		spdlog::critical("Invalid header propagation configuration: {}", error.what());
		return 1;
	}
	spdlog::debug("Header to trailer interceptor registered");

	UserController user_controller(authentication_handler, user_service, *header_registry);
	builder.RegisterService(&user_controller);
	spdlog::debug("User controller created");

	auto server = builder.BuildAndStart();
	if(!server)
	{
		spdlog::critical("Failed to start server on address: {}", address);
		return 1;
	}

	spdlog::info("Server listening on address: {}", address);
	server->Wait();

	return 0;
}
