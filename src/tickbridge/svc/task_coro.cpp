#include <tickbridge/svc/task_coro.hpp>

namespace tickbridge::svc::detail
{

void CoroPromiseBase::rethrowIfHasException()
{
	if (m_unhandled_exception) {
		std::rethrow_exception(std::exchange(m_unhandled_exception, {}));
	}
}

} // namespace tickbridge::svc::detail
