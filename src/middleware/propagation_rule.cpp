#include "middleware/propagation_rule.hpp"

#include <algorithm>
#include <array>

#include <spdlog/spdlog.h>

#include "metadata/header_set.hpp"
#include "middleware/middleware_exceptions.hpp"


namespace
{
	constexpr const char* const PSEUDO_HEADER_PREFIX = ":";
	constexpr const char* const GRPC_RESERVED_PREFIX = "grpc-";

	constexpr std::array<std::string_view, 9> RESERVED_KEYS = {
		"connection",
		"content-length",
		"content-type",
		"host",
		"te",
		"trailer",
		"transfer-encoding",
		"upgrade",
		"user-agent"
	};
}

PropagationRule::PropagationRule(Mode mode, const std::vector<std::string>& keys)
: mode_(mode)
{
	for(const auto& key: keys)
	{
		keys_.emplace(HeaderSet::canonical_key(key));
	}
}

PropagationRule PropagationRule::allow_all()
{
	return {Mode::ALLOW_ALL, {}};
}

PropagationRule PropagationRule::allow_list(const std::vector<std::string>& keys)
{
	return {Mode::ALLOW_LIST, keys};
}

PropagationRule PropagationRule::deny_list(const std::vector<std::string>& keys)
{
	return {Mode::DENY_LIST, keys};
}

PropagationRule PropagationRule::from_mode(Mode mode, const std::vector<std::string>& keys)
{
	if(mode == Mode::ALLOW_ALL)
	{
		return allow_all();
	}

	return {mode, keys};
}

bool PropagationRule::is_reserved_key(std::string_view key)
{
	const auto canonical = HeaderSet::canonical_key(key);

	if(canonical.starts_with(PSEUDO_HEADER_PREFIX) || canonical.starts_with(GRPC_RESERVED_PREFIX))
	{
		return true;
	}

	return std::ranges::find(RESERVED_KEYS, std::string_view(canonical)) != std::end(RESERVED_KEYS);
}

bool PropagationRule::is_valid_key(std::string_view key)
{
	if(key.empty())
	{
		return false;
	}

	return std::ranges::all_of(
			HeaderSet::canonical_key(key),
			[](char character)
			{
				return (character >= 'a' && character <= 'z')
					|| (character >= '0' && character <= '9')
					|| character == '-' || character == '_' || character == '.';
			}
	);
}

void PropagationRule::validate() const
{
	for(const auto& key: keys_)
	{
		if(!is_valid_key(key))
		{
			spdlog::error("Invalid metadata key in propagation rule: '{}'", key);
			throw ConfigurationError("Invalid metadata key in propagation rule: " + key);
		}

		if(mode_ == Mode::ALLOW_LIST && is_reserved_key(key))
		{
			spdlog::error("Reserved key '{}' cannot be allow-listed for propagation", key);
			throw ConfigurationError("Reserved key cannot be allow-listed: " + key);
		}
	}
}

bool PropagationRule::is_propagated(std::string_view key) const
{
	if(is_reserved_key(key))
	{
		return false;
	}

	switch(mode_)
	{
		case Mode::ALLOW_ALL:
			return true;
		case Mode::ALLOW_LIST:
			return keys_.contains(HeaderSet::canonical_key(key));
		case Mode::DENY_LIST:
			return !keys_.contains(HeaderSet::canonical_key(key));
	}

	return false;
}

PropagationRule::Mode PropagationRule::mode() const noexcept
{
	return mode_;
}

const PropagationRule::key_set_type& PropagationRule::keys() const noexcept
{
	return keys_;
}

const char* to_string(PropagationRule::Mode mode) noexcept
{
	using enum PropagationRule::Mode;

	switch(mode)
	{
		case ALLOW_ALL:
			return "allow_all";
		case ALLOW_LIST:
			return "allow_list";
		case DENY_LIST:
			return "deny_list";
	}

	return "unknown";
}
