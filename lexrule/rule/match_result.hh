#ifndef LEXRULE_RULE_MATCH_RESULT_HH
#define LEXRULE_RULE_MATCH_RESULT_HH

#include <lexrule/common.hh>
#include <optional>
#include <ostream>

/// Classification of a window by a rule
enum class Match : u8
{
	None,    ///< window cannot be part of text matched by the rule
	Full,    ///< window is complete match of the rule
	Partial, ///< window is proper prefix of some text that rule could match
};

std::ostream& operator<<(std::ostream& os, Match match);

/// Outcome of evaluating one rule against one window
template<typename T>
struct Match_Result
{
	/// Classification of the window
	Match type = Match::None;

	/// Extracted value, present only for full matches of value producing rules
	std::optional<T> value = std::nullopt;

	static constexpr Match_Result none() { return {}; }

	static constexpr Match_Result partial() { return { .type = Match::Partial }; }

	static constexpr Match_Result full(std::optional<T> value = std::nullopt)
	{
		return { .type = Match::Full, .value = std::move(value) };
	}

	/// Lifts classification of the leaf rule that never produces values
	static constexpr Match_Result from(Match type) { return { .type = type }; }

	constexpr bool is_none()          const { return type == Match::None;    }
	constexpr bool is_match()         const { return type == Match::Full;    }
	constexpr bool is_partial_match() const { return type == Match::Partial; }

	bool operator==(Match_Result const&) const = default;
};

#endif // LEXRULE_RULE_MATCH_RESULT_HH
