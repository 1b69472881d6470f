#ifndef TRAILHEAD_CALL_HEADER_REGISTRY_HPP
#define TRAILHEAD_CALL_HEADER_REGISTRY_HPP

#include <mutex>
#include <string_view>
#include <unordered_map>

#include <grpcpp/grpcpp.h>

#include "metadata/header_set.hpp"


/// Response headers attached to in-flight calls, keyed by server context.
/// Entries exist between HeaderToTrailerInterceptor construction and destruction.
class CallHeaderRegistry
{
public:
	void open(const grpc::ServerContextBase* context);
	void close(const grpc::ServerContextBase* context);

	bool add(const grpc::ServerContextBase* context, std::string_view key, std::string_view value);
	bool set(const grpc::ServerContextBase* context, std::string_view key, std::string_view value);

	[[nodiscard]] HeaderSet headers(const grpc::ServerContextBase* context) const;
	[[nodiscard]] HeaderSet take(const grpc::ServerContextBase* context);

private:
	mutable std::mutex headers_mutex_;
	std::unordered_map<const grpc::ServerContextBase*, HeaderSet> headers_;
};

#endif //TRAILHEAD_CALL_HEADER_REGISTRY_HPP
