#include "middleware/call_context.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

#include "middleware/middleware_exceptions.hpp"


CallContext::CallContext(std::shared_ptr<const PropagationRule> rule) noexcept
: rule_(std::move(rule))
{
}

void CallContext::transition(CallState expected, CallState next)
{
	if(state_ != expected)
	{
		throw CallStateError(fmt::format(
				"Invalid call state transition {} -> {}, call is in state {}",
				to_string(expected), to_string(next), to_string(state_)
		));
	}

	state_ = next;
}

void CallContext::handler_started()
{
	transition(CallState::STARTED, CallState::HANDLER_RUNNING);
}

void CallContext::handler_finished(const grpc::Status& status)
{
	transition(CallState::HANDLER_RUNNING, status.ok() ? CallState::SUCCEEDED : CallState::FAILED);
	status_ = status;
}

void CallContext::handler_cancelled()
{
	transition(CallState::HANDLER_RUNNING, CallState::CANCELLED);
	headers_.clear();
}

void CallContext::trailers_merged()
{
	if(state_ != CallState::SUCCEEDED && state_ != CallState::FAILED)
	{
		throw CallStateError(fmt::format(
				"Trailers can only be merged once the handler finished, call is in state {}",
				to_string(state_)
		));
	}

	state_ = CallState::TRAILERS_MERGED;
}

void CallContext::sent()
{
	transition(CallState::TRAILERS_MERGED, CallState::SENT);
}

void CallContext::capture(const HeaderSet& headers)
{
	if(state_ != CallState::HANDLER_RUNNING)
	{
		throw CallStateError(fmt::format("Headers captured outside of handler execution, call is in state {}", to_string(state_)));
	}

	headers_.append(headers);
}

void CallContext::capture(const HeaderSet::metadata_type& metadata)
{
	capture(HeaderSet::from_metadata(metadata));
}

CallState CallContext::state() const noexcept
{
	return state_;
}

bool CallContext::is_merged() const noexcept
{
	return state_ == CallState::TRAILERS_MERGED || state_ == CallState::SENT;
}

const std::optional<grpc::Status>& CallContext::status() const noexcept
{
	return status_;
}

const HeaderSet& CallContext::headers() const noexcept
{
	return headers_;
}

const PropagationRule& CallContext::rule() const noexcept
{
	return *rule_;
}

const char* to_string(CallState state) noexcept
{
	using enum CallState;

	switch(state)
	{
		case STARTED:
			return "STARTED";
		case HANDLER_RUNNING:
			return "HANDLER_RUNNING";
		case SUCCEEDED:
			return "SUCCEEDED";
		case FAILED:
			return "FAILED";
		case CANCELLED:
			return "CANCELLED";
		case TRAILERS_MERGED:
			return "TRAILERS_MERGED";
		case SENT:
			return "SENT";
	}

	return "UNKNOWN";
}
