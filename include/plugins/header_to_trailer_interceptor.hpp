#ifndef TRAILHEAD_HEADER_TO_TRAILER_INTERCEPTOR_HPP
#define TRAILHEAD_HEADER_TO_TRAILER_INTERCEPTOR_HPP

#include <memory>

#include <grpcpp/grpcpp.h>
#include <grpcpp/support/server_interceptor.h>

#include "middleware/call_context.hpp"
#include "middleware/header_to_trailer_middleware.hpp"
#include "plugins/call_header_registry.hpp"


/// Safe for sync and callback services only, cancellation is probed with ServerContextBase::IsCancelled.
class HeaderToTrailerInterceptor: public grpc::experimental::Interceptor
{
public:
	HeaderToTrailerInterceptor(
			grpc::experimental::ServerRpcInfo* info,
			std::shared_ptr<const HeaderToTrailerMiddleware> middleware,
			std::shared_ptr<CallHeaderRegistry> registry
	);
	~HeaderToTrailerInterceptor() override;

	void Intercept(grpc::experimental::InterceptorBatchMethods* methods) override;

private:
	grpc::experimental::ServerRpcInfo* info_;
	std::shared_ptr<const HeaderToTrailerMiddleware> middleware_;
	std::shared_ptr<CallHeaderRegistry> registry_;
	CallContext context_;

	void ensure_running();
	void on_send_initial_metadata(grpc::experimental::InterceptorBatchMethods* methods);
	void on_send_status(grpc::experimental::InterceptorBatchMethods* methods);
};

class HeaderToTrailerInterceptorFactory: public grpc::experimental::ServerInterceptorFactoryInterface
{
public:
	HeaderToTrailerInterceptorFactory(
			std::shared_ptr<const HeaderToTrailerMiddleware> middleware,
			std::shared_ptr<CallHeaderRegistry> registry
	) noexcept;

	grpc::experimental::Interceptor* CreateServerInterceptor(grpc::experimental::ServerRpcInfo* info) override;

private:
	std::shared_ptr<const HeaderToTrailerMiddleware> middleware_;
	std::shared_ptr<CallHeaderRegistry> registry_;
};

#endif //TRAILHEAD_HEADER_TO_TRAILER_INTERCEPTOR_HPP
