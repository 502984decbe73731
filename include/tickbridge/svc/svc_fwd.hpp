#pragma once

namespace tickbridge::svc
{

template<typename>
class CoroSubTask;
class CoroTask;
template<typename>
class JoinHandle;
template<typename>
class Receiver;
template<typename>
class ResponseReceiver;
template<typename>
class ResponseSender;
template<typename>
class Sender;
class TaskHandle;
class TaskService;
class TaskWaker;
template<typename...>
class UniqueFunction;

namespace detail
{

template<typename>
struct ChannelState;
class CoroPromiseBase;
class CoroSubTaskStateBase;
template<typename>
class CoroSubTaskState;
class CoroTaskState;
template<typename>
struct ResponseSlotState;
struct TaskHeader;
class RunQueueSet;
class TaskServiceImpl;

} // namespace detail

} // namespace tickbridge::svc
