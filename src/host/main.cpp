#include "host_config.hpp"

#include <tickbridge/bridge/bridge_handle.hpp>
#include <tickbridge/svc/channel.hpp>
#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>
#include <tickbridge/world/events.hpp>
#include <tickbridge/world/world.hpp>

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using namespace tickbridge;

namespace
{

const std::string CLI_SECTION_SEPARATOR = "__";
const std::string DEFAULT_CONFIG_PATH = "tickbridge_host.ini";

// Event bridged from background producers into the world
struct TextMessage {
	std::string text;
	std::string source;
};

// Counter living in the world, only touched by main-thread callbacks
struct PingCounter {
	uint64_t pings = 0;
};

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("tickbridge_host", "tickbridge - world tick bridge demo host");

	for (const host::HostConfig::SchemeEntry &entry : host::HostConfig::hostScheme()) {
		std::shared_ptr<cxxopts::Value> cli_value;
		switch (entry.default_value.index()) {
		case 0:
			cli_value = cxxopts::value<std::string>();
			break;
		case 1:
			cli_value = cxxopts::value<int64_t>();
			break;
		case 2:
			// Allows `--log__demo_events` instead of `--log__demo_events=true`
			cli_value = cxxopts::value<bool>()->default_value("true");
			break;
		default:
			break;
		}

		options.add_options(entry.section)(entry.section + CLI_SECTION_SEPARATOR + entry.parameter_name,
			entry.description, cli_value);
	}

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information")
		("c,config", "Path to the INI config file, created if missing",
			cxxopts::value<std::string>()->default_value(DEFAULT_CONFIG_PATH));
	// clang-format on

	return options;
}

void patchConfig(const cxxopts::ParseResult &result, host::HostConfig &config)
{
	for (const auto &keyvalue : result.arguments()) {
		size_t sep_idx = keyvalue.key().find(CLI_SECTION_SEPARATOR);
		if (sep_idx == std::string::npos) {
			continue;
		}

		std::string section = keyvalue.key().substr(0, sep_idx);
		std::string parameter = keyvalue.key().substr(sep_idx + CLI_SECTION_SEPARATOR.size());
		config.patch(section, parameter, keyvalue.value());
	}
}

svc::CoroSubTask<size_t> greeterTask(bridge::TaskContext ctx)
{
	Log::info("Greeter task started on a worker at tick {}", ctx.currentTick().value);

	size_t resources = co_await ctx.runOnMainThread([](bridge::MainThreadContext &mtc) {
		Log::info("Greeter callback runs on the world thread at tick {}", mtc.current_tick.value);
		return mtc.world.numResources();
	});

	Log::info("World had {} resources when the greeter looked", resources);
	co_return resources;
}

svc::CoroTask pingTask(bridge::TaskContext ctx, svc::Sender<TextMessage> tx, uint64_t period)
{
	try {
		for (uint64_t i = 0;; i++) {
			co_await ctx.sleepUpdates(period);

			uint64_t pings = co_await ctx.runOnMainThread([](bridge::MainThreadContext &mtc) {
				PingCounter *counter = mtc.world.findResource<PingCounter>();
				if (!counter) {
					counter = &mtc.world.insertResource<PingCounter>();
				}
				return ++counter->pings;
			});

			if (!tx.send(TextMessage { fmt::format("ping #{} (total {})", i, pings), "ping task" })) {
				Log::info("Ping task: event channel closed, exiting");
				co_return;
			}
		}
	}
	catch (const Exception &e) {
		if (e.error() == BridgeErrc::ClockClosed || e.error() == BridgeErrc::WorldUnavailable
			|| e.error() == BridgeErrc::ResponseLost) {
			Log::info("Ping task: world is gone ({}), exiting", e.error().message());
			co_return;
		}
		throw;
	}
}

int runHost(const host::HostSettings &settings)
{
	world::World world;

	bridge::BridgeHandle::Config bridge_cfg;
	bridge_cfg.task_service.num_threads = settings.task_threads;
	bridge_cfg.main_thread_queue.max_callbacks_per_tick = settings.max_callbacks_per_tick;

	bridge::BridgeHandle bridge(world, bridge_cfg);

	auto [tx, rx] = svc::makeChannel<TextMessage>();
	bridge.addEventChannel(std::move(rx));

	svc::JoinHandle<size_t> greeter = bridge.spawnBackgroundTask(greeterTask);

	std::vector<svc::TaskHandle> tasks;
	tasks.emplace_back(bridge.spawnBackgroundTask(
		[tx = tx](bridge::TaskContext ctx) mutable { return pingTask(std::move(ctx), std::move(tx), 4); }));

	// A plain thread is a producer too, channels don't care
	std::jthread producer([tx = tx, interval = settings.tick_interval](std::stop_token stop) mutable {
		for (uint64_t i = 0; !stop.stop_requested(); i++) {
			if (!tx.send(TextMessage { fmt::format("hello #{}", i), "producer thread" })) {
				return;
			}
			std::this_thread::sleep_for(interval * 3);
		}
	});

	// Drop our copy, senders now live only in producers
	tx = svc::Sender<TextMessage>();

	world::EventReader<TextMessage> reader;
	for (uint64_t i = 0; i < settings.ticks; i++) {
		world::TickId tick = bridge.tickPump();

		for (const TextMessage &msg : reader.read(world.events<TextMessage>())) {
			if (settings.log_demo_events) {
				Log::info("[tick {}] {}: {}", tick.value, msg.source, msg.text);
			}
		}

		std::this_thread::sleep_for(settings.tick_interval);
	}

	for (svc::TaskHandle &task : tasks) {
		if (task.finished()) {
			task.rethrowIfFailed();
		}
	}

	if (greeter.finished()) {
		Log::info("Greeter reported {} resources", greeter.takeResult());
	}

	Log::info("Ran {} ticks, {} tasks still alive", settings.ticks, bridge.taskService().numLiveTasks());
	// Cancel tasks and stop the producer before tearing down the bridge
	tasks.clear();
	greeter = svc::JoinHandle<size_t>();
	producer.request_stop();
	producer.join();

	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
	try {
		cxxopts::Options opts = makeCliOptions();
		cxxopts::ParseResult cli;

		try {
			cli = opts.parse(argc, argv);
		}
		catch (cxxopts::exceptions::exception &ex) {
			fmt::print(stderr, "Invalid options provided, use -h (--help) to get usage help.\nError details:\n{}\n",
				ex.what());
			return EXIT_FAILURE;
		}

		if (cli.count("help")) {
			fmt::print("{}\n", opts.help());
			return EXIT_SUCCESS;
		}

		host::HostSettings settings;
		{
			host::HostConfig config(cli["config"].as<std::string>(), host::HostConfig::hostScheme());
			patchConfig(cli, config);
			settings = host::HostSettings::fromConfig(config);
		}

		Log::setLevel(settings.log_level);
		return runHost(settings);
	}
	catch (const Exception &e) {
		Log::fatal("Uncaught tickbridge::Exception instance");
		Log::fatal("what(): {}", e.what());
		auto loc = e.where();
		Log::fatal("where(): {}:{}", loc.file_name(), loc.line());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (...) {
		Log::fatal("Uncaught exception of unknown type");
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
}
