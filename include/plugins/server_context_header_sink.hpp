#ifndef TRAILHEAD_SERVER_CONTEXT_HEADER_SINK_HPP
#define TRAILHEAD_SERVER_CONTEXT_HEADER_SINK_HPP

#include <grpcpp/grpcpp.h>

#include "metadata/i_header_sink.hpp"
#include "plugins/call_header_registry.hpp"


/// Records response headers of an intercepted call in the registry.
/// Calls without a registry entry get the headers as initial metadata directly.
class ServerContextHeaderSink: public IHeaderSink
{
public:
	ServerContextHeaderSink(grpc::ServerContext* context, CallHeaderRegistry& registry) noexcept;

	void add_header(std::string_view key, std::string_view value) override;
	void set_header(std::string_view key, std::string_view value) override;

private:
	grpc::ServerContext* context_;
	CallHeaderRegistry& registry_;
};

#endif //TRAILHEAD_SERVER_CONTEXT_HEADER_SINK_HPP
