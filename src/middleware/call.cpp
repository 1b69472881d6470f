#include "middleware/call.hpp"

#include <utility>


Call::Call(std::string method, HeaderSet request_metadata)
: method_(std::move(method)), request_metadata_(std::move(request_metadata))
{
}

void Call::add_header(std::string_view key, std::string_view value)
{
	headers_.add(key, value);
}

void Call::set_header(std::string_view key, std::string_view value)
{
	headers_.set(key, value);
}

void Call::add_trailer(std::string_view key, std::string_view value)
{
	trailers_.add(key, value);
}

const std::string& Call::method() const noexcept
{
	return method_;
}

const HeaderSet& Call::request_metadata() const noexcept
{
	return request_metadata_;
}

const HeaderSet& Call::headers() const noexcept
{
	return headers_;
}

HeaderSet& Call::trailers() noexcept
{
	return trailers_;
}

const HeaderSet& Call::trailers() const noexcept
{
	return trailers_;
}

void Call::cancel() noexcept
{
	cancelled_.store(true, std::memory_order_release);
}

bool Call::is_cancelled() const noexcept
{
	return cancelled_.load(std::memory_order_acquire);
}
