#include "plugins/server_context_header_sink.hpp"

#include <cassert>

#include <spdlog/spdlog.h>

#include "metadata/header_set.hpp"


ServerContextHeaderSink::ServerContextHeaderSink(grpc::ServerContext* context, CallHeaderRegistry& registry) noexcept
: context_(context), registry_(registry)
{
	assert(context_);
}

void ServerContextHeaderSink::add_header(std::string_view key, std::string_view value)
{
	if(!registry_.add(context_, key, value))
	{
		context_->AddInitialMetadata(HeaderSet::canonical_key(key), std::string(value));
	}
}

void ServerContextHeaderSink::set_header(std::string_view key, std::string_view value)
{
	if(!registry_.set(context_, key, value))
	{
		// initial metadata of the server context cannot be replaced
		spdlog::debug("Call is not intercepted, header '{}' appended instead of replaced", key);
		context_->AddInitialMetadata(HeaderSet::canonical_key(key), std::string(value));
	}
}
