#ifndef LEXRULE_RULE_LEAF_HH
#define LEXRULE_RULE_LEAF_HH

#include <lexrule/rule/match_result.hh>
#include <string_view>

/// Classification of windows by leaf rules.
///
/// Leaves never produce values, so they are independent from token type.
namespace leaf
{
	/// Full when window equals literal, Partial when it's proper prefix of it
	Match literal(std::string_view literal, std::string_view window);

	/// Full when all runes of window are numeric
	Match numeric(std::string_view window);

	/// Full when all runes of window are letters
	Match alphabetic(std::string_view window);

	/// Full when all runes of window are whitespace
	Match whitespace(std::string_view window);

	/// Full when window ends with suffix
	Match ends_with(std::string_view suffix, std::string_view window);
}

#endif // LEXRULE_RULE_LEAF_HH
