#include "host_config.hpp"

#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace tickbridge::host
{

namespace
{

bool equalsNoCase(std::string_view a, std::string_view b) noexcept
{
	return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
		return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
	});
}

[[noreturn]] void throwInvalid(const std::string &msg, std::source_location loc)
{
	throw Exception::fromError(BridgeErrc::InvalidConfig, msg.c_str(), loc);
}

} // namespace

HostConfig::HostConfig(std::filesystem::path path, Scheme scheme) : m_path(std::move(path))
{
	m_ini.SetUnicode();

	if (!m_path.empty()) {
		// Missing file is fine, it will be created with default values
		SI_Error err = m_ini.LoadFile(m_path.string().c_str());
		if (err < 0 && std::filesystem::exists(m_path)) {
			Log::warn("Failed to load config file '{}' (SimpleIni error {}), using defaults", m_path.string(),
				static_cast<int>(err));
		}
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());

		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// Multiline descriptions are not supported, SimpleIni wants "; " before every line
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
			value = entry.default_value;
		} else {
			value = optionFromString(value_ptr, entry.default_value.index());
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

HostConfig::~HostConfig() noexcept
{
	if (m_path.empty()) {
		return;
	}

	std::error_code ec;
	if (m_path.has_parent_path()) {
		std::filesystem::create_directories(m_path.parent_path(), ec);
	}

	if (ec) {
		Log::warn("Can't create directory for config file '{}': {}", m_path.string(), ec.message());
		return;
	}

	if (SI_Error err = m_ini.SaveFile(m_path.string().c_str()); err < 0) {
		Log::warn("Failed to save config file '{}' (SimpleIni error {})", m_path.string(), static_cast<int>(err));
	}
}

void HostConfig::patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
	Location loc)
{
	auto iter_section = m_data.find(section);
	if (iter_section == m_data.end()) {
		throwInvalid(fmt::format("unknown config section '{}'", section), loc);
	}

	auto iter_param = iter_section->second.find(parameter_name);
	if (iter_param == iter_section->second.end()) {
		throwInvalid(fmt::format("unknown config option '{}/{}'", section, parameter_name), loc);
	}

	iter_param->second = optionFromString(value_string, iter_param->second.index(), loc);
	Log::debug("Config option {}/{} patched to '{}'", section, parameter_name, value_string);
}

std::optional<std::string> HostConfig::optionString(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = findOption(section, parameter_name);
	if (opt && std::holds_alternative<std::string>(*opt)) {
		return std::get<std::string>(*opt);
	}

	return std::nullopt;
}

std::optional<int64_t> HostConfig::optionInt64(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = findOption(section, parameter_name);
	if (opt && std::holds_alternative<int64_t>(*opt)) {
		return std::get<int64_t>(*opt);
	}

	return std::nullopt;
}

std::optional<bool> HostConfig::optionBool(std::string_view section, std::string_view parameter_name) const
{
	const option_t *opt = findOption(section, parameter_name);
	if (opt && std::holds_alternative<bool>(*opt)) {
		return std::get<bool>(*opt);
	}

	return std::nullopt;
}

int64_t HostConfig::getInt64(std::string_view section, std::string_view parameter_name, int64_t min_value,
	int64_t max_value, Location loc) const
{
	auto opt = optionInt64(section, parameter_name);
	if (!opt.has_value()) {
		throwInvalid(fmt::format("missing integer config option '{}/{}'", section, parameter_name), loc);
	}

	if (*opt < min_value || *opt > max_value) {
		throwInvalid(fmt::format("config option '{}/{}' = {} is out of range [{}; {}]", section, parameter_name,
						 *opt, min_value, max_value),
			loc);
	}

	return *opt;
}

std::string HostConfig::getString(std::string_view section, std::string_view parameter_name, Location loc) const
{
	if (auto opt = optionString(section, parameter_name); opt.has_value()) {
		return std::move(*opt);
	}

	throwInvalid(fmt::format("missing string config option '{}/{}'", section, parameter_name), loc);
}

HostConfig::Scheme HostConfig::hostScheme()
{
	Scheme s;

	s.push_back({ "host", "ticks", "Number of world updates to run before exiting", int64_t(20) });
	s.push_back({ "host", "tick_interval_ms", "Sleep between world updates, milliseconds", int64_t(50) });
	s.push_back({ "runtime", "threads", "Task worker threads, 0 = pick automatically", int64_t(0) });
	s.push_back({ "runtime", "max_callbacks_per_tick", "Main thread callbacks run per tick, 0 = unbounded",
		int64_t(0) });
	s.push_back({ "log", "level", "Minimal log level: trace, debug, info, warn, error, fatal, off",
		std::string("info") });
	s.push_back({ "log", "demo_events", "Log every bridged demo event", true });

	return s;
}

std::string HostConfig::optionToString(const option_t &value)
{
	switch (value.index()) {
	case 0:
		static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, option_t>>);
		return std::get<std::string>(value);

	case 1:
		static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, option_t>>);
		return std::to_string(std::get<int64_t>(value));

	case 2:
		static_assert(std::is_same_v<bool, std::variant_alternative_t<2, option_t>>);
		return std::get<bool>(value) ? "true" : "false";

	default:
		static_assert(std::variant_size_v<option_t> == 3);
		return "";
	}
}

HostConfig::option_t HostConfig::optionFromString(std::string_view s, size_t type, Location loc)
{
	switch (type) {
	case 0:
		return std::string(s);

	case 1: {
		int64_t value = 0;
		auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
		if (ec != std::errc() || ptr != s.data() + s.size()) {
			throwInvalid(fmt::format("'{}' is not a valid integer", s), loc);
		}
		return value;
	}

	case 2:
		if (equalsNoCase(s, "true")) {
			return true;
		}
		if (equalsNoCase(s, "false")) {
			return false;
		}
		throwInvalid(fmt::format("'{}' is not a valid boolean (expected true/false)", s), loc);

	default:
		static_assert(std::variant_size_v<option_t> == 3);
		throwInvalid(fmt::format("unknown config option type {}", type), loc);
	}
}

const HostConfig::option_t *HostConfig::findOption(std::string_view section,
	std::string_view parameter_name) const noexcept
{
	auto iter_section = m_data.find(section);
	if (iter_section == m_data.end()) {
		return nullptr;
	}

	auto iter_param = iter_section->second.find(parameter_name);
	return iter_param != iter_section->second.end() ? &iter_param->second : nullptr;
}

HostSettings HostSettings::fromConfig(const HostConfig &config)
{
	HostSettings settings;

	settings.ticks = static_cast<uint64_t>(config.getInt64("host", "ticks", 1, INT64_MAX));
	settings.tick_interval = std::chrono::milliseconds(config.getInt64("host", "tick_interval_ms", 0, 60'000));
	settings.task_threads = static_cast<size_t>(config.getInt64("runtime", "threads", 0, 1024));
	settings.max_callbacks_per_tick = static_cast<size_t>(
		config.getInt64("runtime", "max_callbacks_per_tick", 0, INT64_MAX));

	const std::string level_name = config.getString("log", "level");
	auto level = Log::levelFromName(level_name);
	if (!level.has_value()) {
		throwInvalid(fmt::format("unknown log level '{}'", level_name), std::source_location::current());
	}
	settings.log_level = *level;

	settings.log_demo_events = config.optionBool("log", "demo_events").value_or(true);

	return settings;
}

} // namespace tickbridge::host
