#pragma once

#include <tickbridge/svc/svc_fwd.hpp>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace tickbridge::svc
{

namespace detail
{

template<typename T>
constexpr bool IS_UNIQUE_FUNCTION = false;

template<typename T>
constexpr bool IS_UNIQUE_FUNCTION<UniqueFunction<T>> = true;

} // namespace detail

// Callable object suitable for storage in `UniqueFunction`. Only lambdas and
// lambda-like objects are accepted; `UniqueFunction` itself is excluded to
// avoid accidental double wrapping.
template<typename T, typename Res, typename... Args>
concept CUniqueFunctionLambda = std::is_class_v<std::remove_cvref_t<T>>
	&& std::is_nothrow_destructible_v<std::remove_cvref_t<T>> && std::is_invocable_r_v<Res, T &, Args...>
	&& !detail::IS_UNIQUE_FUNCTION<std::remove_cvref_t<T>>;

// Owning storage for a move-only callable, modeled after `std::move_only_function`
// with unnecessary features stripped. Unlike `std::function`, lambdas
// capturing move-only objects (response slots, unique pointers) can be stored.
//
// Main-thread callbacks travel between threads in this form.
template<typename Res, typename... Args>
class UniqueFunction<Res(Args...)> {
public:
	UniqueFunction() = default;

	template<CUniqueFunctionLambda<Res, Args...> Fn>
	UniqueFunction(Fn &&fn)
	{
		using ST = Storage<std::remove_cvref_t<Fn>>;
		m_storage = new ST(std::forward<Fn>(fn));
		m_storage->dtor = [](StorageHeader *thiz) noexcept { delete static_cast<ST *>(thiz); };
		m_storage->invoker = [](StorageHeader *thiz, TParam<Args>... args) -> Res {
			// Have no `std::invoke_r<Res>` before C++23
			if constexpr (std::is_void_v<Res>) {
				std::invoke(static_cast<ST *>(thiz)->object, std::forward<TParam<Args>>(args)...);
			} else {
				return std::invoke(static_cast<ST *>(thiz)->object, std::forward<TParam<Args>>(args)...);
			}
		};
	}

	UniqueFunction(UniqueFunction &&other) noexcept : m_storage(std::exchange(other.m_storage, nullptr)) {}

	UniqueFunction &operator=(UniqueFunction &&other) noexcept
	{
		std::swap(m_storage, other.m_storage);
		return *this;
	}

	~UniqueFunction() noexcept
	{
		if (m_storage) {
			m_storage->dtor(m_storage);
		}
	}

	UniqueFunction(const UniqueFunction &) = delete;
	UniqueFunction &operator=(const UniqueFunction &) = delete;

	explicit operator bool() const noexcept { return m_storage != nullptr; }

	Res operator()(Args... args) { return m_storage->invoker(m_storage, std::forward<Args>(args)...); }

private:
	// Pass scalar parameters directly by value, forward other ones
	template<typename T>
	using TParam = std::conditional_t<std::is_scalar_v<T>, T, T &&>;

	struct StorageHeader;

	using TDtor = void (*)(StorageHeader *thiz) noexcept;
	using TInvoker = Res (*)(StorageHeader *thiz, TParam<Args>...);

	struct StorageHeader {
		TDtor dtor = nullptr;
		TInvoker invoker = nullptr;
	};

	template<typename Fn>
	struct Storage : StorageHeader {
		template<typename F>
		explicit Storage(F &&fn) : object(std::forward<F>(fn))
		{}

		Fn object;
	};

	StorageHeader *m_storage = nullptr;
};

} // namespace tickbridge::svc
