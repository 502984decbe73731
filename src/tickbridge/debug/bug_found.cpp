#include <tickbridge/debug/bug_found.hpp>

#include <tickbridge/util/log.hpp>

#include <backward.hpp>

#include <cstdlib>

namespace tickbridge::debug
{

void bugFound(std::string_view message, std::source_location where)
{
	Log::fatal({ "----[ BUG FOUND ]----", where });
	Log::fatal({ "Please report this issue and attach the log output. Some related information:", where });
	Log::fatal({ "Explanation message: {}", where }, message);

	backward::StackTrace st;
	st.load_here();

	backward::Printer pr;
	pr.snippet = false;
	pr.color_mode = backward::ColorMode::automatic;
	pr.address = true;
	pr.object = true;
	pr.reverse = false;
	pr.print(st);

	Log::fatal("----[ ABORTING ]----");
	std::abort();
}

} // namespace tickbridge::debug
