#ifndef LEXRULE_UNICODE_HH
#define LEXRULE_UNICODE_HH

#include <lexrule/common.hh>
#include <utility>

/// All unicode related operations
namespace unicode
{
	inline namespace special_runes
	{
		[[maybe_unused]] constexpr u32 Rune_Error = 0xfffd;
	}

	/// is_numeric returns true if `rune` is a decimal digit of any script, superscript digit or vulgar fraction
	bool is_numeric(u32 rune);

	/// is_space returns true if `space` belongs to Unicode White_Space property (including newline)
	bool is_space(u32 space);

	/// is_letter returns true if `letter` is considered a letter by Unicode
	bool is_letter(u32 letter);

	/// Returns true if every rune of `s` satisfies `predicate`.
	///
	/// Empty string satisfies every predicate. Malformed UTF-8 satisfies none.
	bool all_of(std::string_view s, bool(*predicate)(u32));
}

/// utf8 encoding and decoding
namespace utf8
{
	using namespace unicode::special_runes;

	/// Decodes rune and returns remaining string
	///
	/// On malformed input returns Rune_Error and unchanged string
	auto decode(std::string_view s) -> std::pair<u32, std::string_view>;

	/// Returns length of the first rune in the provided string, 0 when first byte cannot start a rune
	auto length(std::string_view s) -> usize;
}

/// Trim whitespace from left and right
void trim(std::string_view &s);

#endif
