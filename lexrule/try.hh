#ifndef LEXRULE_TRY_HH
#define LEXRULE_TRY_HH

#include <lexrule/result.hh>

/// Evaluates to the value of Result-like expression or returns its error from the enclosing function.
///
/// Requires statement expressions (GCC and Clang extension).
#define Try(Value)                                                             \
	({                                                                           \
		auto try_result = (Value);                                                 \
		using Try_Trait [[maybe_unused]] = Try_Traits<std::decay_t<decltype(try_result)>>; \
		if (not Try_Trait::is_ok(try_result)) [[unlikely]]                         \
			return Try_Trait::yield_error(std::move(try_result));                    \
		Try_Trait::yield_value(std::move(try_result));                             \
	})

/// Describes how Try macro splits type into value and error.
/// Specialized for every type that may be used with Try.
template<typename>
struct Try_Traits;

/// Optional error: nothing means success
template<>
struct Try_Traits<std::optional<Error>>
{
	static bool is_ok(std::optional<Error> const& o) { return not o.has_value(); }

	static std::nullopt_t yield_value(std::optional<Error>&&) { return std::nullopt; }

	static Error yield_error(std::optional<Error>&& o)
	{
		ensure(o.has_value(), "Yielding error from optional without one");
		return std::move(*o);
	}
};

template<typename T>
struct Try_Traits<Result<T>>
{
	static bool is_ok(Result<T> const& r) { return r.has_value(); }

	static auto yield_value(Result<T>&& r)
	{
		if constexpr (not std::is_void_v<T>) {
			return std::move(*r);
		}
	}

	static Error yield_error(Result<T>&& r)
	{
		ensure(not r.has_value(), "Yielding error from result with value");
		return std::move(r.error());
	}
};

#endif // LEXRULE_TRY_HH
