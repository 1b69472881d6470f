#include "plugins/header_to_trailer_interceptor.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "middleware/middleware_exceptions.hpp"


HeaderToTrailerInterceptor::HeaderToTrailerInterceptor(
		grpc::experimental::ServerRpcInfo* info,
		std::shared_ptr<const HeaderToTrailerMiddleware> middleware,
		std::shared_ptr<CallHeaderRegistry> registry
)
: info_(info),
middleware_(std::move(middleware)),
registry_(std::move(registry)),
context_(middleware_->begin_call())
{
	registry_->open(info_->server_context());
}

HeaderToTrailerInterceptor::~HeaderToTrailerInterceptor()
{
	registry_->close(info_->server_context());
}

void HeaderToTrailerInterceptor::Intercept(grpc::experimental::InterceptorBatchMethods* methods)
{
	using grpc::experimental::InterceptionHookPoints;

	try
	{
		if(methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_INITIAL_METADATA))
		{
			ensure_running();
		}

		// initial metadata and status travel in the same batch when the handler fails early
		if(methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_INITIAL_METADATA))
		{
			on_send_initial_metadata(methods);
		}

		if(methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS))
		{
			on_send_status(methods);
		}
	}
	catch(const CallStateError& error)
	{
		spdlog::error("Header propagation skipped for {}: {}", info_->method(), error.what());
	}

	methods->Proceed();
}

void HeaderToTrailerInterceptor::ensure_running()
{
	if(context_.state() == CallState::STARTED)
	{
		context_.handler_started();
	}
}

void HeaderToTrailerInterceptor::on_send_initial_metadata(grpc::experimental::InterceptorBatchMethods* methods)
{
	ensure_running();

	auto* initial_metadata = methods->GetSendInitialMetadata();
	if(!initial_metadata)
	{
		return;
	}

	// registry headers are captured at status time, they may still be replaced or extended
	context_.capture(*initial_metadata);
	registry_->headers(info_->server_context()).append_to(*initial_metadata);
}

void HeaderToTrailerInterceptor::on_send_status(grpc::experimental::InterceptorBatchMethods* methods)
{
	ensure_running();

	if(info_->server_context()->IsCancelled())
	{
		context_.handler_cancelled();
		spdlog::debug("Call {} cancelled, captured headers discarded", info_->method());
		return;
	}

	context_.capture(registry_->take(info_->server_context()));
	context_.handler_finished(methods->GetSendStatus());

	// set whenever PRE_SEND_STATUS is
	const auto copied = middleware_->merge(context_, *methods->GetSendTrailingMetadata());
	spdlog::debug("Propagated {} header values to trailers of {}", copied, info_->method());
	context_.sent();
}

HeaderToTrailerInterceptorFactory::HeaderToTrailerInterceptorFactory(
		std::shared_ptr<const HeaderToTrailerMiddleware> middleware,
		std::shared_ptr<CallHeaderRegistry> registry
) noexcept
: middleware_(std::move(middleware)), registry_(std::move(registry))
{
}

grpc::experimental::Interceptor* HeaderToTrailerInterceptorFactory::CreateServerInterceptor(grpc::experimental::ServerRpcInfo* info)
{
	return new HeaderToTrailerInterceptor(info, middleware_, registry_);
}
