#pragma once

#include <tickbridge/util/log.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <simpleini/SimpleIni.h>

namespace tickbridge::host
{

// INI-backed host configuration. Every parameter is described by a scheme
// entry; parameters missing from the file get their default value, which
// is written back (with the description as a comment) when the config is destroyed.
class HostConfig {
public:
	using Location = std::source_location;
	using option_t = std::variant<std::string, int64_t, bool>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// Empty `path` means "defaults only", nothing is loaded or saved.
	// Throws `Exception` with `BridgeErrc::InvalidConfig` if a value in the file can't be parsed.
	HostConfig(std::filesystem::path path, Scheme scheme);
	HostConfig(HostConfig &&) = delete;
	HostConfig(const HostConfig &) = delete;
	HostConfig &operator=(HostConfig &&) = delete;
	HostConfig &operator=(const HostConfig &) = delete;
	~HostConfig() noexcept;

	// Override a value (e.g. from command line). The new value is not saved to the file.
	// Throws `Exception` with `BridgeErrc::InvalidConfig` for unknown options or unparsable values.
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		Location loc = Location::current());

	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;
	std::optional<bool> optionBool(std::string_view section, std::string_view parameter_name) const;

	// Throws `Exception` with `BridgeErrc::InvalidConfig` if the option
	// is missing or its value is outside of [min_value; max_value]
	int64_t getInt64(std::string_view section, std::string_view parameter_name, int64_t min_value,
		int64_t max_value, Location loc = Location::current()) const;
	std::string getString(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;

	// Scheme of the `tickbridge_host` config file
	static Scheme hostScheme();

	static std::string optionToString(const option_t &value);
	// Throws `Exception` with `BridgeErrc::InvalidConfig`
	static option_t optionFromString(std::string_view s, size_t type, Location loc = Location::current());

private:
	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	CSimpleIniA m_ini;

	const option_t *findOption(std::string_view section, std::string_view parameter_name) const noexcept;
};

// Validated values used by the host loop
struct HostSettings {
	uint64_t ticks = 0;
	std::chrono::milliseconds tick_interval { 0 };
	size_t task_threads = 0;
	size_t max_callbacks_per_tick = 0;
	Log::Level log_level = Log::Level::Info;
	bool log_demo_events = true;

	// Throws `Exception` with `BridgeErrc::InvalidConfig`
	static HostSettings fromConfig(const HostConfig &config);
};

} // namespace tickbridge::host
