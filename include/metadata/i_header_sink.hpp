#ifndef TRAILHEAD_I_HEADER_SINK_HPP
#define TRAILHEAD_I_HEADER_SINK_HPP

#include <string_view>


class IHeaderSink
{
public:
	virtual ~IHeaderSink() = default;

	virtual void add_header(std::string_view key, std::string_view value) = 0;
	virtual void set_header(std::string_view key, std::string_view value) = 0;
};

#endif //TRAILHEAD_I_HEADER_SINK_HPP
