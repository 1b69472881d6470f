#ifndef TRAILHEAD_HEADER_SET_HPP
#define TRAILHEAD_HEADER_SET_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <initializer_list>

#include <grpcpp/support/string_ref.h>


/// Keys are stored in lower case, values of one key keep their insertion order.
class HeaderSet
{
public:
	using value_list_type = std::vector<std::string>;
	using container_type = std::map<std::string, value_list_type, std::less<>>;
	using const_iterator = container_type::const_iterator;
	using metadata_type = std::multimap<std::string, std::string>;
	using client_metadata_type = std::multimap<grpc::string_ref, grpc::string_ref>;

	HeaderSet() = default;
	HeaderSet(std::initializer_list<std::pair<std::string_view, std::string_view>> entries);

	[[nodiscard]] static std::string canonical_key(std::string_view key);

	[[nodiscard]] static HeaderSet from_metadata(const metadata_type& metadata);
	[[nodiscard]] static HeaderSet from_metadata(const client_metadata_type& metadata);

	void add(std::string_view key, std::string_view value);
	/// Replaces every value of key.
	void set(std::string_view key, std::string_view value);
	void append(const HeaderSet& other);

	/// Values land after the entries the multimap already holds for the same key.
	void append_to(metadata_type& metadata) const;

	[[nodiscard]] const value_list_type& values(std::string_view key) const;
	[[nodiscard]] bool contains(std::string_view key) const;

	[[nodiscard]] bool empty() const noexcept;
	[[nodiscard]] std::size_t size() const noexcept;
	void clear() noexcept;

	[[nodiscard]] const_iterator begin() const noexcept;
	[[nodiscard]] const_iterator end() const noexcept;

	bool operator==(const HeaderSet& other) const = default;

private:
	container_type entries_;
	std::size_t value_count_ = 0;
};

#endif //TRAILHEAD_HEADER_SET_HPP
