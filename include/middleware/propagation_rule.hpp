#ifndef TRAILHEAD_PROPAGATION_RULE_HPP
#define TRAILHEAD_PROPAGATION_RULE_HPP

#include <set>
#include <string>
#include <string_view>
#include <vector>


class PropagationRule
{
public:
	enum class Mode
	{
		ALLOW_ALL,
		ALLOW_LIST,
		DENY_LIST
	};

	using key_set_type = std::set<std::string, std::less<>>;

	[[nodiscard]] static PropagationRule allow_all();
	[[nodiscard]] static PropagationRule allow_list(const std::vector<std::string>& keys);
	[[nodiscard]] static PropagationRule deny_list(const std::vector<std::string>& keys);
	[[nodiscard]] static PropagationRule from_mode(Mode mode, const std::vector<std::string>& keys);

	/// Keys owned by the HTTP/2 transport or the gRPC protocol, never copied.
	[[nodiscard]] static bool is_reserved_key(std::string_view key);
	[[nodiscard]] static bool is_valid_key(std::string_view key);

	/// Throws ConfigurationError when the rule cannot be honoured.
	void validate() const;

	[[nodiscard]] bool is_propagated(std::string_view key) const;

	[[nodiscard]] Mode mode() const noexcept;
	[[nodiscard]] const key_set_type& keys() const noexcept;

private:
	PropagationRule(Mode mode, const std::vector<std::string>& keys);

	Mode mode_;
	key_set_type keys_;
};

[[nodiscard]] const char* to_string(PropagationRule::Mode mode) noexcept;

#endif //TRAILHEAD_PROPAGATION_RULE_HPP
