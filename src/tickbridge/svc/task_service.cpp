#include <tickbridge/svc/task_service.hpp>

#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>

#include "task_header.hpp"
#include "task_service_impl.hpp"
#include "task_worker.hpp"

#include <mutex>
#include <vector>

namespace tickbridge::svc
{

namespace
{

// This number is subtracted from threads count reported by the system.
// Expecting one major thread outside of this system - the one owning the world.
constexpr size_t STD_THREAD_COUNT_OFFSET = 1;
// The number of threads started in case no explicit request was made and `std`
// didn't return meaningful value. Assuming an "average" 4-threaded machine.
constexpr size_t DEFAULT_THREAD_COUNT = 4 - STD_THREAD_COUNT_OFFSET;

TaskService::Config patchConfig(TaskService::Config cfg)
{
	if (cfg.num_threads == 0) {
		size_t std_hint = std::thread::hardware_concurrency();
		if (std_hint == 0) {
			cfg.num_threads = DEFAULT_THREAD_COUNT;
		} else if (std_hint <= STD_THREAD_COUNT_OFFSET) {
			cfg.num_threads = 1;
		} else {
			cfg.num_threads = std_hint - STD_THREAD_COUNT_OFFSET;
		}
	}

	return cfg;
}

} // namespace

namespace detail
{

TaskServiceImpl::TaskServiceImpl(TaskService::Config cfg)
	: m_cfg(cfg), m_queue_set(cfg.num_threads), m_worker_threads(std::make_unique<std::thread[]>(cfg.num_threads))
{
	Log::info("Starting task service with {} threads", cfg.num_threads);
	for (size_t i = 0; i < m_cfg.num_threads; i++) {
		m_worker_threads[i] = std::thread(TaskWorker::threadFn, std::ref(*this), std::ref(m_queue_set), i);
	}
}

TaskServiceImpl::~TaskServiceImpl()
{
	Log::info("Stopping task service");
	m_queue_set.requestStopAll();

	// XXX: a task blocking its worker thread forever (instead of suspending) will hang here
	for (size_t i = 0; i < m_cfg.num_threads; i++) {
		if (m_worker_threads[i].joinable()) {
			m_worker_threads[i].join();
		}
	}

	cancelAndDrainRemaining();
}

TaskHeader *TaskServiceImpl::createTask(CoroTask task)
{
	if (!task.valid()) [[unlikely]] {
		throw Exception::fromError(std::make_error_condition(std::errc::invalid_argument),
			"attempt to spawn an empty coroutine");
	}

	auto *header = new TaskHeader;
	header->service = this;
	header->resume_point = task.get();
	task.get().promise().setTaskHeader(header);
	header->coroutine = std::move(task);

	{
		std::lock_guard lock(m_live_tasks_lock);
		m_live_tasks.insert(header);
	}

	Log::trace("Spawned task {}", static_cast<void *>(header));
	scheduleTask(header);
	return header;
}

void TaskServiceImpl::pushTask(TaskHeader *header) noexcept
{
	// Plain round-robin. Woken tasks hop between workers freely,
	// their frames are small and cache affinity is not a concern here.
	size_t queue = m_next_queue.fetch_add(1, std::memory_order_relaxed) % m_queue_set.numQueues();
	m_queue_set.pushTask(queue, header);
}

void TaskServiceImpl::onTaskFinished(TaskHeader *header) noexcept
{
	std::lock_guard lock(m_live_tasks_lock);
	m_live_tasks.erase(header);
}

size_t TaskServiceImpl::numLiveTasks() const noexcept
{
	std::lock_guard lock(m_live_tasks_lock);
	return m_live_tasks.size();
}

void TaskServiceImpl::cancelAndDrainRemaining() noexcept
{
	// Workers are gone, so every scheduled task is sitting in some queue and
	// every other live task is idle (suspended). Cancel and run them all here.
	// Destroying frames can wake or spawn more tasks, so repeat until none is left.
	std::vector<TaskHeader *> remaining;

	while (true) {
		remaining.clear();

		{
			std::lock_guard lock(m_live_tasks_lock);
			if (m_live_tasks.empty()) {
				break;
			}

			for (TaskHeader *header : m_live_tasks) {
				addTaskRef(header);
				remaining.push_back(header);
			}
		}

		Log::debug("Cancelling {} unfinished tasks", remaining.size());

		for (TaskHeader *header : remaining) {
			header->atomic_word.fetch_or(TASK_CANCEL_BIT, std::memory_order_acq_rel);
			scheduleTask(header);
			releaseTaskRef(header);
		}

		for (size_t queue = 0; queue < m_queue_set.numQueues(); queue++) {
			while (TaskHeader *header = m_queue_set.tryPopTask(queue)) {
				TaskWorker::runTask(*this, header);
			}
		}
	}
}

} // namespace detail

TaskService::TaskService(Config cfg) : m_impl(std::make_unique<detail::TaskServiceImpl>(patchConfig(cfg))) {}

TaskService::~TaskService() = default;

TaskHandle TaskService::spawn(CoroTask task)
{
	return TaskHandle(m_impl->createTask(std::move(task)));
}

size_t TaskService::numThreads() const noexcept
{
	return m_impl->numThreads();
}

size_t TaskService::numLiveTasks() const noexcept
{
	return m_impl->numLiveTasks();
}

} // namespace tickbridge::svc
