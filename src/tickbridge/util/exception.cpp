#include <tickbridge/util/exception.hpp>

#include <fmt/format.h>

namespace tickbridge
{

// Out of line to keep the vtable in the library
Exception::~Exception() = default;

Exception Exception::fromError(std::error_condition ec, std::string_view details, Location loc)
{
	std::string what = fmt::format("{}: {} [{}:{}]", details, ec.message(), ec.category().name(), ec.value());
	return Exception(std::move(what), ec, loc);
}

Exception::Exception(std::string what, std::error_condition error, Location loc)
	: m_what(std::move(what)), m_error(error), m_where(loc)
{}

} // namespace tickbridge
