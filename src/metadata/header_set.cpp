#include "metadata/header_set.hpp"

#include <algorithm>
#include <cctype>


HeaderSet::HeaderSet(std::initializer_list<std::pair<std::string_view, std::string_view>> entries)
{
	for(const auto& [key, value]: entries)
	{
		add(key, value);
	}
}

std::string HeaderSet::canonical_key(std::string_view key)
{
	std::string canonical(key);
	std::ranges::transform(
			canonical, std::begin(canonical),
			[](unsigned char character)
			{
				return static_cast<char>(std::tolower(character));
			}
	);

	return canonical;
}

HeaderSet HeaderSet::from_metadata(const metadata_type& metadata)
{
	HeaderSet header_set;
	for(const auto& [key, value]: metadata)
	{
		header_set.add(key, value);
	}

	return header_set;
}

HeaderSet HeaderSet::from_metadata(const client_metadata_type& metadata)
{
	HeaderSet header_set;
	for(const auto& [key, value]: metadata)
	{
		header_set.add(
				std::string_view(key.data(), key.length()),
				std::string_view(value.data(), value.length())
		);
	}

	return header_set;
}

void HeaderSet::add(std::string_view key, std::string_view value)
{
	entries_[canonical_key(key)].emplace_back(value);
	++value_count_;
}

void HeaderSet::set(std::string_view key, std::string_view value)
{
	auto& values = entries_[canonical_key(key)];
	value_count_ -= values.size();
	values.assign(1, std::string(value));
	++value_count_;
}

void HeaderSet::append(const HeaderSet& other)
{
	for(const auto& [key, values]: other)
	{
		auto& target = entries_[key];
		target.insert(std::end(target), std::begin(values), std::end(values));
		value_count_ += values.size();
	}
}

void HeaderSet::append_to(metadata_type& metadata) const
{
	for(const auto& [key, values]: entries_)
	{
		for(const auto& value: values)
		{
			// multimap::insert places the element at the upper bound of the equal range
			metadata.insert(std::make_pair(key, value));
		}
	}
}

const HeaderSet::value_list_type& HeaderSet::values(std::string_view key) const
{
	static const value_list_type no_values;

	if(const auto entry = entries_.find(canonical_key(key)); entry != std::end(entries_))
	{
		return entry->second;
	}

	return no_values;
}

bool HeaderSet::contains(std::string_view key) const
{
	return entries_.contains(canonical_key(key));
}

bool HeaderSet::empty() const noexcept
{
	return entries_.empty();
}

std::size_t HeaderSet::size() const noexcept
{
	return value_count_;
}

void HeaderSet::clear() noexcept
{
	entries_.clear();
	value_count_ = 0;
}

HeaderSet::const_iterator HeaderSet::begin() const noexcept
{
	return std::cbegin(entries_);
}

HeaderSet::const_iterator HeaderSet::end() const noexcept
{
	return std::cend(entries_);
}
