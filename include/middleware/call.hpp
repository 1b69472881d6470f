#ifndef TRAILHEAD_CALL_HPP
#define TRAILHEAD_CALL_HPP

#include <atomic>
#include <string>

#include "metadata/header_set.hpp"
#include "metadata/i_header_sink.hpp"


/// Transport independent view of a single call travelling through the handler chain.
class Call: public IHeaderSink
{
public:
	Call(std::string method, HeaderSet request_metadata);

	Call(const Call&) = delete;
	Call& operator=(const Call&) = delete;

	void add_header(std::string_view key, std::string_view value) override;
	void set_header(std::string_view key, std::string_view value) override;
	void add_trailer(std::string_view key, std::string_view value);

	[[nodiscard]] const std::string& method() const noexcept;
	[[nodiscard]] const HeaderSet& request_metadata() const noexcept;
	[[nodiscard]] const HeaderSet& headers() const noexcept;

	[[nodiscard]] HeaderSet& trailers() noexcept;
	[[nodiscard]] const HeaderSet& trailers() const noexcept;

	void cancel() noexcept;
	[[nodiscard]] bool is_cancelled() const noexcept;

private:
	std::string method_;
	HeaderSet request_metadata_;
	HeaderSet headers_;
	HeaderSet trailers_;

	std::atomic<bool> cancelled_ = false;
};

#endif //TRAILHEAD_CALL_HPP
