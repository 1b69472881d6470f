#ifndef TRAILHEAD_STRING_UTILS_HPP
#define TRAILHEAD_STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>


inline bool starts_with_case_insensitive(std::string_view value, std::string_view prefix) noexcept
{
	if(value.size() < prefix.size())
	{
		return false;
	}

	return std::ranges::equal(
			value.substr(0, prefix.size()), prefix,
			[](unsigned char lhs, unsigned char rhs)
			{
				return std::tolower(lhs) == std::tolower(rhs);
			}
	);
}

inline std::string trim(std::string_view value)
{
	const auto is_space = [](unsigned char character)
	{
		return std::isspace(character) != 0;
	};

	const auto begin = std::find_if_not(std::begin(value), std::end(value), is_space);
	const auto end = std::find_if_not(std::rbegin(value), std::rend(value), is_space).base();

	return begin < end ? std::string(begin, end) : std::string();
}

#endif //TRAILHEAD_STRING_UTILS_HPP
