#include <tickbridge/os/futex.hpp>

#include <cassert>
#include <cerrno>
#include <climits>

#if defined(__x86_64__) || defined(__i386__)
	#include <emmintrin.h>
#endif

#include <linux/futex.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace tickbridge::os
{

namespace
{

inline void cpuRelax() noexcept
{
#if defined(__x86_64__) || defined(__i386__)
	_mm_pause();
#elif defined(__aarch64__)
	asm volatile("yield");
#endif
}

} // namespace

void Futex::waitInfinite(std::atomic_uint32_t *addr, uint32_t value) noexcept
{
	long res = syscall(SYS_futex, addr, FUTEX_WAIT_PRIVATE, value, nullptr, nullptr, 0);
	if (res == -1) {
		// Value already changed or a signal arrived, both are "spurious" wakeups for the caller
		assert(errno == EAGAIN || errno == EINTR);
	}
}

void Futex::wakeSingle(std::atomic_uint32_t *addr) noexcept
{
	[[maybe_unused]] long res = syscall(SYS_futex, addr, FUTEX_WAKE_PRIVATE, 1, nullptr, nullptr, 0);
	assert(res != -1);
}

void Futex::wakeAll(std::atomic_uint32_t *addr) noexcept
{
	[[maybe_unused]] long res = syscall(SYS_futex, addr, FUTEX_WAKE_PRIVATE, INT_MAX, nullptr, nullptr, 0);
	assert(res != -1);
}

// --- FutexLock ---

void FutexLock::lock() noexcept
{
	constexpr uint32_t MAX_SPIN_ROUNDS = 4;

	// Locks in this library are held for a handful of instructions
	// (push/pop/swap), so a short spin almost always succeeds
	for (uint32_t round = 0; round < MAX_SPIN_ROUNDS; round++) {
		uint32_t expected = 0;
		if (m_payload.compare_exchange_weak(expected, 1, std::memory_order_acquire, std::memory_order_relaxed))
			[[likely]] {
			return;
		}

		if (expected == 2) {
			// Others are already sleeping on it, no point in spinning
			break;
		}

		for (uint32_t i = 0; i < (1u << round); i++) {
			cpuRelax();
		}
	}

	// Mark the lock contended and sleep until the owner releases it.
	// We can't know whether anyone else waits, so always store 2 when we take it from here.
	while (m_payload.exchange(2, std::memory_order_acquire) != 0) {
		Futex::waitInfinite(&m_payload, 2);
	}
}

bool FutexLock::try_lock() noexcept
{
	uint32_t expected = 0;
	return m_payload.compare_exchange_strong(expected, 1, std::memory_order_acquire, std::memory_order_relaxed);
}

void FutexLock::unlock() noexcept
{
	if (m_payload.exchange(0, std::memory_order_release) == 2) {
		Futex::wakeSingle(&m_payload);
	}
}

} // namespace tickbridge::os
