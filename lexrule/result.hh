#ifndef LEXRULE_RESULT_HH
#define LEXRULE_RESULT_HH

#include <tl/expected.hpp>

#include <lexrule/errors.hh>

#include <type_traits>
#include <utility>

/// Holds either T or Error
template<typename T>
struct [[nodiscard("This value may contain critical error, so it should NOT be ignored")]] Result : tl::expected<T, Error>
{
	using Storage = tl::expected<T, Error>;

	template<typename Arg> requires std::is_constructible_v<T, Arg&&>
	constexpr Result(Arg &&arg)
		: Storage(tl::in_place, std::forward<Arg>(arg))
	{
	}

	inline Result(Error error)
		: Storage(tl::unexpected(std::move(error)))
	{
	}

	/// Error without source range, like `return errors::Missing_File { path };`
	template<typename Details>
	requires (not std::is_constructible_v<T, Details&&>) && requires (Details d) {
		{ Error { .details = std::move(d) } };
	}
	inline Result(Details details)
		: Storage(tl::unexpected(Error { .details = std::move(details) }))
	{
	}

	/// Fill error range if it's empty and we have an error
	inline Result<T> with(File_Range file) &&
	{
		if (not Storage::has_value()) {
			if (auto& target = Storage::error().file; !target) {
				target = file;
			}
		}
		return std::move(*this);
	}

	/// Checks if result holds error of given kind
	template<typename Details>
	inline bool holds_error() const
	{
		return not Storage::has_value() && std::holds_alternative<Details>(Storage::error().details);
	}
};

#endif // LEXRULE_RESULT_HH
