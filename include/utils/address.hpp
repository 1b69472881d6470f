#ifndef TRAILHEAD_ADDRESS_HPP
#define TRAILHEAD_ADDRESS_HPP

#include <cstdint>
#include <string>
#include <utility>


struct Address
{
	std::string hostname;
	uint16_t port = 0;

	Address() = default;

	Address(std::string address_hostname, uint16_t address_port)
	: hostname(std::move(address_hostname)), port(address_port)
	{};

	[[nodiscard]] std::string to_string() const
	{
		return hostname + ":" + std::to_string(port);
	}
};

#endif //TRAILHEAD_ADDRESS_HPP
