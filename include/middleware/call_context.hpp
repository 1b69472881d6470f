#ifndef TRAILHEAD_CALL_CONTEXT_HPP
#define TRAILHEAD_CALL_CONTEXT_HPP

#include <memory>
#include <optional>

#include <grpcpp/support/status.h>

#include "metadata/header_set.hpp"
#include "middleware/propagation_rule.hpp"


enum class CallState
{
	STARTED,
	HANDLER_RUNNING,
	SUCCEEDED,
	FAILED,
	CANCELLED,
	TRAILERS_MERGED,
	SENT
};

[[nodiscard]] const char* to_string(CallState state) noexcept;

/// Owned by exactly one call. Transitions:
/// STARTED -> HANDLER_RUNNING -> (SUCCEEDED | FAILED) -> TRAILERS_MERGED -> SENT
/// HANDLER_RUNNING -> CANCELLED
class CallContext
{
public:
	explicit CallContext(std::shared_ptr<const PropagationRule> rule) noexcept;

	void handler_started();
	void handler_finished(const grpc::Status& status);
	void handler_cancelled();
	void trailers_merged();
	void sent();

	void capture(const HeaderSet& headers);
	void capture(const HeaderSet::metadata_type& metadata);

	[[nodiscard]] CallState state() const noexcept;
	[[nodiscard]] bool is_merged() const noexcept;

	[[nodiscard]] const std::optional<grpc::Status>& status() const noexcept;
	[[nodiscard]] const HeaderSet& headers() const noexcept;
	[[nodiscard]] const PropagationRule& rule() const noexcept;

private:
	void transition(CallState expected, CallState next);

	std::shared_ptr<const PropagationRule> rule_;
	HeaderSet headers_;
	std::optional<grpc::Status> status_;
	CallState state_ = CallState::STARTED;
};

#endif //TRAILHEAD_CALL_CONTEXT_HPP
