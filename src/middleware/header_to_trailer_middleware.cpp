#include "middleware/header_to_trailer_middleware.hpp"

#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include "middleware/middleware_exceptions.hpp"


namespace
{
	std::shared_ptr<const PropagationRule> make_validated_rule(PropagationRule rule)
	{
		rule.validate();
		return std::make_shared<const PropagationRule>(std::move(rule));
	}
}

HeaderToTrailerMiddleware::HeaderToTrailerMiddleware(PropagationRule rule)
: rule_(make_validated_rule(std::move(rule)))
{
	spdlog::info("Header to trailer propagation enabled, mode: {}, keys: [{}]", to_string(rule_->mode()), fmt::join(rule_->keys(), ", "));
}

CallContext HeaderToTrailerMiddleware::begin_call() const
{
	return CallContext(rule_);
}

grpc::Status HeaderToTrailerMiddleware::wrap(Call& call, const next_handler_type& next_handler) const
{
	auto context = begin_call();
	context.handler_started();

	grpc::Status status;
	try
	{
		status = next_handler(call);
	}
	catch(const TransportFault& fault)
	{
		if(call.is_cancelled())
		{
			context.handler_cancelled();
			throw;
		}

		context.capture(call.headers());
		context.handler_finished(fault.status());

		if(fault.trailers_permitted())
		{
			merge(context, call.trailers());
		}
		else
		{
			spdlog::debug(
					"Transport does not permit trailers on faulted call {}, dropping {} captured header values",
					call.method(), context.headers().size()
			);
		}
		throw;
	}

	if(call.is_cancelled())
	{
		context.handler_cancelled();
		spdlog::debug("Call {} cancelled, captured headers discarded", call.method());
		return status;
	}

	context.capture(call.headers());
	context.handler_finished(status);

	merge(context, call.trailers());
	context.sent();

	return status;
}

HeaderSet HeaderToTrailerMiddleware::propagated_headers(const CallContext& context) const
{
	const auto& rule = context.rule();

	HeaderSet propagated;
	for(const auto& [key, values]: context.headers())
	{
		if(!rule.is_propagated(key))
		{
			spdlog::trace("Header '{}' not eligible for propagation", key);
			continue;
		}

		for(const auto& value: values)
		{
			spdlog::debug("Copied header '{}' with value '{}' to trailers", key, value);
			propagated.add(key, value);
		}
	}

	return propagated;
}

std::size_t HeaderToTrailerMiddleware::merge(CallContext& context, HeaderSet& trailers) const
{
	if(context.is_merged())
	{
		return 0;
	}

	const auto propagated = propagated_headers(context);
	context.trailers_merged();
	trailers.append(propagated);

	return propagated.size();
}

std::size_t HeaderToTrailerMiddleware::merge(CallContext& context, HeaderSet::metadata_type& trailers) const
{
	if(context.is_merged())
	{
		return 0;
	}

	const auto propagated = propagated_headers(context);
	context.trailers_merged();
	propagated.append_to(trailers);

	return propagated.size();
}

const PropagationRule& HeaderToTrailerMiddleware::rule() const noexcept
{
	return *rule_;
}
