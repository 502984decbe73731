#pragma once

#include <tickbridge/visibility.hpp>

#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>

namespace tickbridge
{

// Base exception class for all exceptions thrown by the library.
// Exceptions thrown by user callbacks and tasks pass through unchanged.
//
// Use this class directly instead of subclassing it. Reacting on the
// error kind is done by comparing `error()` with a `BridgeErrc` value:
//
//   catch (const Exception &e) {
//     if (e.error() == BridgeErrc::ClockClosed) { ... }
//   }
class TICKBRIDGE_API Exception : public std::exception {
public:
	using Location = std::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Source location where the exception was thrown.
	// Pass it as `Log::Format { "...", e.where() }` to log from that location.
	const Location &where() const noexcept { return m_where; }

	// Construct an exception carrying `ec`. `details` describe the failed operation.
	// Use with `BridgeErrc` values, `std::errc` ones are fine for argument errors.
	//
	// `what()` string will be formatted like this:
	// "<details>: <ec.message> [<ec.category>:<ec>]"
	static Exception fromError(std::error_condition ec, std::string_view details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace tickbridge
