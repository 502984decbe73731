#include <tickbridge/svc/task_waker.hpp>

#include <tickbridge/debug/bug_found.hpp>

#include "task_header.hpp"

namespace tickbridge::svc
{

TaskWaker::TaskWaker(const TaskWaker &other) noexcept : m_header(other.m_header)
{
	if (m_header) {
		detail::addTaskRef(m_header);
	}
}

TaskWaker &TaskWaker::operator=(const TaskWaker &other) noexcept
{
	if (m_header != other.m_header) {
		reset();
		m_header = other.m_header;
		if (m_header) {
			detail::addTaskRef(m_header);
		}
	}

	return *this;
}

TaskWaker::~TaskWaker()
{
	reset();
}

void TaskWaker::wake() const noexcept
{
	if (m_header) {
		detail::scheduleTask(m_header);
	}
}

void TaskWaker::reset() noexcept
{
	if (m_header) {
		detail::releaseTaskRef(std::exchange(m_header, nullptr));
	}
}

TaskWaker TaskWaker::prepareSuspend(detail::TaskHeader *header, std::coroutine_handle<> resume_point) noexcept
{
	if (!header) [[unlikely]] {
		debug::bugFound("Suspending operation awaited outside of a task coroutine");
	}

	header->resume_point = resume_point;
	detail::addTaskRef(header);
	return TaskWaker(header);
}

} // namespace tickbridge::svc
