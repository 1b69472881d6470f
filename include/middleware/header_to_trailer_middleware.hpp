#ifndef TRAILHEAD_HEADER_TO_TRAILER_MIDDLEWARE_HPP
#define TRAILHEAD_HEADER_TO_TRAILER_MIDDLEWARE_HPP

#include <functional>
#include <memory>

#include <grpcpp/support/status.h>

#include "metadata/header_set.hpp"
#include "middleware/call.hpp"
#include "middleware/call_context.hpp"
#include "middleware/propagation_rule.hpp"


/// Copies response headers attached during call handling into the trailing metadata.
class HeaderToTrailerMiddleware
{
public:
	using next_handler_type = std::function<grpc::Status(Call&)>;

	explicit HeaderToTrailerMiddleware(PropagationRule rule);

	[[nodiscard]] CallContext begin_call() const;

	/// TransportFault thrown by next_handler is rethrown after a best-effort merge.
	grpc::Status wrap(Call& call, const next_handler_type& next_handler) const;

	/// Only the first merge of a context appends, returns the number of values appended.
	std::size_t merge(CallContext& context, HeaderSet& trailers) const;
	std::size_t merge(CallContext& context, HeaderSet::metadata_type& trailers) const;

	[[nodiscard]] const PropagationRule& rule() const noexcept;

private:
	std::shared_ptr<const PropagationRule> rule_;

	[[nodiscard]] HeaderSet propagated_headers(const CallContext& context) const;
};

#endif //TRAILHEAD_HEADER_TO_TRAILER_MIDDLEWARE_HPP
