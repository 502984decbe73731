#include <tickbridge/util/error_condition.hpp>

namespace tickbridge
{

namespace
{

struct BridgeErrorCategory : std::error_category {
	const char *name() const noexcept override { return "tickbridge error"; }

	std::string message(int code) const override
	{
		switch (static_cast<BridgeErrc>(code)) {
		case BridgeErrc::DuplicateBridge: return "A channel bridge for this event type is already registered";
		case BridgeErrc::WorldUnavailable: return "The world is torn down and can't accept main-thread work";
		case BridgeErrc::ClockClosed: return "The tick clock was closed while waiting on it";
		case BridgeErrc::ResponseLost: return "Main-thread callback was dropped without delivering a result";
		case BridgeErrc::InvariantViolation: return "A single-consumer invariant was violated";
		case BridgeErrc::InvalidConfig: return "Configuration value is invalid";
		case BridgeErrc::ResourceMissing: return "Requested world resource does not exist";
		case BridgeErrc::TaskCancelled: return "Task was cancelled before producing a result";
		// No `default` to make `-Werror -Wswitch` protection work
		}

		return "Unknown error";
	}
};

const BridgeErrorCategory g_category;

} // anonymous namespace

std::error_condition make_error_condition(BridgeErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace tickbridge
