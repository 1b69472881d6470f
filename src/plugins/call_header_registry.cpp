#include "plugins/call_header_registry.hpp"

#include <utility>


void CallHeaderRegistry::open(const grpc::ServerContextBase* context)
{
	std::unique_lock lock(headers_mutex_);
	headers_.try_emplace(context);
}

void CallHeaderRegistry::close(const grpc::ServerContextBase* context)
{
	std::unique_lock lock(headers_mutex_);
	headers_.erase(context);
}

bool CallHeaderRegistry::add(const grpc::ServerContextBase* context, std::string_view key, std::string_view value)
{
	std::unique_lock lock(headers_mutex_);

	const auto entry = headers_.find(context);
	if(entry == std::end(headers_))
	{
		return false;
	}

	entry->second.add(key, value);
	return true;
}

bool CallHeaderRegistry::set(const grpc::ServerContextBase* context, std::string_view key, std::string_view value)
{
	std::unique_lock lock(headers_mutex_);

	const auto entry = headers_.find(context);
	if(entry == std::end(headers_))
	{
		return false;
	}

	entry->second.set(key, value);
	return true;
}

HeaderSet CallHeaderRegistry::headers(const grpc::ServerContextBase* context) const
{
	std::unique_lock lock(headers_mutex_);

	if(const auto entry = headers_.find(context); entry != std::end(headers_))
	{
		return entry->second;
	}

	return {};
}

HeaderSet CallHeaderRegistry::take(const grpc::ServerContextBase* context)
{
	std::unique_lock lock(headers_mutex_);

	const auto entry = headers_.find(context);
	if(entry == std::end(headers_))
	{
		return {};
	}

	auto taken = std::move(entry->second);
	entry->second.clear();

	return taken;
}
