#pragma once

namespace tickbridge::bridge
{

class BridgeHandle;
template<typename>
class ChannelEventBridge;
class MainThreadQueue;
struct MainThreadContext;
class TaskContext;
class TickClock;

namespace detail
{

struct AttachedBridge;
struct BridgeShared;
class IChannelEventBridge;

} // namespace detail

} // namespace tickbridge::bridge
