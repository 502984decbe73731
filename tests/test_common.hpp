#pragma once

#define CATCH_CONFIG_EXPERIMENTAL_REDIRECT
#include <catch2/catch.hpp>

#include <tickbridge/world/tick_id.hpp>

#include <system_error>

namespace Catch
{

template<>
struct StringMaker<std::error_code> {
	static std::string convert(const std::error_code &ec);
};

template<>
struct StringMaker<std::error_condition> {
	static std::string convert(const std::error_condition &ec);
};

template<>
struct StringMaker<tickbridge::world::TickId> {
	static std::string convert(tickbridge::world::TickId tick);
};

} // namespace Catch
