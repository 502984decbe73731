#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/task_service.hpp>

#include "run_queue_set.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <unordered_set>

namespace tickbridge::svc::detail
{

class TaskServiceImpl {
public:
	explicit TaskServiceImpl(TaskService::Config cfg);
	TaskServiceImpl(TaskServiceImpl &&) = delete;
	TaskServiceImpl(const TaskServiceImpl &) = delete;
	TaskServiceImpl &operator=(TaskServiceImpl &&) = delete;
	TaskServiceImpl &operator=(const TaskServiceImpl &) = delete;
	~TaskServiceImpl();

	// Returns a header with one reference owned by the caller. The task is already scheduled.
	TaskHeader *createTask(CoroTask task);

	// Put a scheduled task (with its run queue reference) into some worker's queue
	void pushTask(TaskHeader *header) noexcept;
	// Called by a worker once the task frame is destroyed
	void onTaskFinished(TaskHeader *header) noexcept;

	size_t numThreads() const noexcept { return m_cfg.num_threads; }
	size_t numLiveTasks() const noexcept;

private:
	const TaskService::Config m_cfg;

	RunQueueSet m_queue_set;
	std::unique_ptr<std::thread[]> m_worker_threads;
	std::atomic_size_t m_next_queue = 0;

	mutable os::FutexLock m_live_tasks_lock;
	std::unordered_set<TaskHeader *> m_live_tasks;

	void cancelAndDrainRemaining() noexcept;
};

} // namespace tickbridge::svc::detail
