#pragma once

#include <tickbridge/svc/join_handle.hpp>
#include <tickbridge/svc/svc_fwd.hpp>
#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/svc/task_handle.hpp>
#include <tickbridge/visibility.hpp>

#include <cstddef>
#include <memory>

namespace tickbridge::svc
{

// Multi-threaded executor of coroutine tasks.
//
// Each worker thread owns a run queue and sleeps on it when there is nothing
// to do. Spawned and woken tasks are distributed round-robin between queues.
// A task is never executed by two threads at once, but can migrate between
// workers across suspensions.
//
// Destroying the service stops all workers, then destroys every unfinished
// task (their handles become `finished()`).
class TICKBRIDGE_API TaskService {
public:
	struct Config {
		// Number of worker threads. 0 means pick automatically
		// (hardware concurrency minus one thread for the world, but at least one).
		size_t num_threads = 0;
	};

	explicit TaskService(Config cfg);
	TaskService(TaskService &&) = delete;
	TaskService(const TaskService &) = delete;
	TaskService &operator=(TaskService &&) = delete;
	TaskService &operator=(const TaskService &) = delete;
	~TaskService();

	// Schedule a task coroutine for execution. It starts running immediately
	// on some worker thread, independently of the calling thread.
	[[nodiscard]] TaskHandle spawn(CoroTask task);

	// Schedule a sub-task as a standalone task, its value
	// (or exception) is delivered through the returned handle
	template<typename T>
	[[nodiscard]] JoinHandle<T> spawn(CoroSubTask<T> task)
	{
		auto result = std::make_shared<detail::JoinResult<T>>();
		TaskHandle handle = spawn(detail::storeTaskResult(std::move(task), result));
		return JoinHandle<T>(std::move(handle), std::move(result));
	}

	// Actual number of worker threads after resolving `Config::num_threads`
	size_t numThreads() const noexcept;
	// Number of spawned tasks not yet finished
	size_t numLiveTasks() const noexcept;

private:
	std::unique_ptr<detail::TaskServiceImpl> m_impl;
};

} // namespace tickbridge::svc
