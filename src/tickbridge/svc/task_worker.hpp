#pragma once

#include <tickbridge/svc/svc_fwd.hpp>

#include <cstddef>

namespace tickbridge::svc::detail
{

class TaskWorker {
public:
	static void threadFn(TaskServiceImpl &service, RunQueueSet &queue_set, size_t my_queue);

	// Poll the task once: resume it, or destroy it if cancellation was requested.
	// Consumes the run queue reference carried by `header`.
	static void runTask(TaskServiceImpl &service, TaskHeader *header) noexcept;
};

} // namespace tickbridge::svc::detail
