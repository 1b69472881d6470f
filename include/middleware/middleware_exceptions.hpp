#ifndef TRAILHEAD_MIDDLEWARE_EXCEPTIONS_HPP
#define TRAILHEAD_MIDDLEWARE_EXCEPTIONS_HPP

#include <stdexcept>
#include <utility>

#include <grpcpp/support/status.h>


struct ConfigurationError: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

struct CallStateError: public std::logic_error
{
	using std::logic_error::logic_error;
};

/// Raised by a transport binding when the call failed below the handler level.
class TransportFault: public std::runtime_error
{
public:
	explicit TransportFault(grpc::Status status, bool trailers_permitted = true)
	: std::runtime_error(status.error_message()),
	status_(std::move(status)),
	trailers_permitted_(trailers_permitted)
	{};

	[[nodiscard]] const grpc::Status& status() const noexcept
	{
		return status_;
	}

	[[nodiscard]] bool trailers_permitted() const noexcept
	{
		return trailers_permitted_;
	}

private:
	grpc::Status status_;
	bool trailers_permitted_;
};

#endif //TRAILHEAD_MIDDLEWARE_EXCEPTIONS_HPP
