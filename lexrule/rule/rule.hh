#ifndef LEXRULE_RULE_HH
#define LEXRULE_RULE_HH

#include <lexrule/common.hh>
#include <lexrule/errors.hh>
#include <lexrule/rule/leaf.hh>
#include <lexrule/rule/match_result.hh>

#include <functional>
#include <iomanip>
#include <ostream>
#include <string>
#include <vector>

/// Representation of a node in matching rules tree
///
/// Rules are immutable after construction and classify text windows
/// without any state besides recursion. Tree is owned by its root:
/// each node holds its children by value inside `arguments`.
template<typename T>
struct Rule
{
	/// Produces token value from the whole matched window
	using Extractor = std::function<T(std::string_view)>;

	/// Matches if equal to the provided literal
	static Rule literal(std::string text);

	/// Matches if all characters are numeric
	static Rule numeric();

	/// Matches if all characters are alphabetic
	static Rule alphabetic();

	/// Matches if all characters are whitespace
	static Rule whitespace();

	/// Matches if the ending matches provided suffix
	static Rule ends_with(std::string suffix);

	/// Value extraction if matching the provided rule
	static Rule value(Rule inner, Extractor extract);

	/// Matches like provided rule, but never produces a value
	///
	/// Child's value is discarded by matches() itself, so scanners and
	/// tokenize never see values from ignored text.
	static Rule ignore(Rule inner);

	/// Matches if the provided rule doesn't match
	static Rule negate(Rule inner);

	/// Matches only as provided rule does, used for grouping
	static Rule only(Rule inner);

	/// Matches if both of the provided rules match
	static Rule both(Rule a, Rule b);

	/// Matches if either of the provided rules match, preferring the first one
	static Rule either(Rule a, Rule b);

	/// Matches if all of the provided rules match
	static Rule all(std::vector<Rule> rules, Extractor extract);

	/// Matches if any of the provided rules match
	static Rule any(std::vector<Rule> rules);

	/// Available rule types
	enum class Type : u8
	{
		Literal,    ///< `end` matches only `end`, `e` and `en` are partial
		Numeric,    ///< all runes are numeric, like `123`
		Alphabetic, ///< all runes are letters, like `zażółć`
		Whitespace, ///< all runes are whitespace
		Ends_With,  ///< window ends with given text
		Value,      ///< extracts value from window matched by child
		Ignore,     ///< matches as child, value is dropped here instead of by the caller
		Not,        ///< matches when child doesn't
		Only,       ///< transparent grouping of child
		Both,       ///< conjunction of two children
		Either,     ///< ordered alternative of two children
		All,        ///< conjunction of many children with value extraction
		Any,        ///< first full match of many children, trusted only without earlier partials
	};

	/// Type of rule node
	Type type;

	/// Literal text or suffix for leaf rules
	std::string text{};

	/// Value producer for Value and All nodes
	Extractor extract{};

	/// Child nodes
	std::vector<Rule> arguments{};

	/// Classify window, recursively evaluating children
	Match_Result<T> matches(std::string_view window) const;
};

template<typename T>
Rule<T> Rule<T>::literal(std::string text)
{
	return { .type = Type::Literal, .text = std::move(text) };
}

template<typename T>
Rule<T> Rule<T>::numeric()
{
	return { .type = Type::Numeric };
}

template<typename T>
Rule<T> Rule<T>::alphabetic()
{
	return { .type = Type::Alphabetic };
}

template<typename T>
Rule<T> Rule<T>::whitespace()
{
	return { .type = Type::Whitespace };
}

template<typename T>
Rule<T> Rule<T>::ends_with(std::string suffix)
{
	return { .type = Type::Ends_With, .text = std::move(suffix) };
}

template<typename T>
Rule<T> Rule<T>::value(Rule inner, Extractor extract)
{
	ensure(bool(extract), "Value rule requires extractor");
	Rule rule { .type = Type::Value, .extract = std::move(extract) };
	rule.arguments.push_back(std::move(inner));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::ignore(Rule inner)
{
	Rule rule { .type = Type::Ignore };
	rule.arguments.push_back(std::move(inner));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::negate(Rule inner)
{
	Rule rule { .type = Type::Not };
	rule.arguments.push_back(std::move(inner));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::only(Rule inner)
{
	Rule rule { .type = Type::Only };
	rule.arguments.push_back(std::move(inner));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::both(Rule a, Rule b)
{
	Rule rule { .type = Type::Both };
	rule.arguments.push_back(std::move(a));
	rule.arguments.push_back(std::move(b));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::either(Rule a, Rule b)
{
	Rule rule { .type = Type::Either };
	rule.arguments.push_back(std::move(a));
	rule.arguments.push_back(std::move(b));
	return rule;
}

template<typename T>
Rule<T> Rule<T>::all(std::vector<Rule> rules, Extractor extract)
{
	ensure(bool(extract), "All rule requires extractor");
	return { .type = Type::All, .extract = std::move(extract), .arguments = std::move(rules) };
}

template<typename T>
Rule<T> Rule<T>::any(std::vector<Rule> rules)
{
	return { .type = Type::Any, .arguments = std::move(rules) };
}

template<typename T>
Match_Result<T> Rule<T>::matches(std::string_view window) const
{
	using Result = Match_Result<T>;

	switch (type) {
	case Type::Literal:    return Result::from(leaf::literal(text, window));
	case Type::Numeric:    return Result::from(leaf::numeric(window));
	case Type::Alphabetic: return Result::from(leaf::alphabetic(window));
	case Type::Whitespace: return Result::from(leaf::whitespace(window));
	case Type::Ends_With:  return Result::from(leaf::ends_with(text, window));

	case Type::Value:
		switch (arguments.front().matches(window).type) {
		case Match::Full:    return Result::full(extract(window));
		case Match::Partial: return Result::partial();
		case Match::None:    return Result::none();
		}
		unreachable();

	case Type::Ignore:
		return Result::from(arguments.front().matches(window).type);

	case Type::Not:
		return arguments.front().matches(window).is_none() ? Result::full() : Result::none();

	case Type::Only:
		return arguments.front().matches(window);

	case Type::Both:
		{
			auto lhs = arguments[0].matches(window);
			if (not lhs.is_match() || not arguments[1].matches(window).is_match()) {
				return Result::none();
			}
			return lhs;
		}

	case Type::Either:
		{
			// Partial match of the first alternative defers the second one,
			// since the first one may still complete on longer window
			if (auto lhs = arguments[0].matches(window); not lhs.is_none()) {
				return lhs;
			}
			return arguments[1].matches(window);
		}

	case Type::All:
		// First rule that isn't full match decides for the whole group
		for (auto const& rule : arguments) {
			if (auto const result = rule.matches(window).type; result != Match::Full) {
				return Result::from(result);
			}
		}
		return Result::full(extract(window));

	case Type::Any:
		{
			unsigned partial_matches = 0;
			for (auto const& rule : arguments) {
				auto result = rule.matches(window);
				switch (result.type) {
				break; case Match::None:
				break; case Match::Partial:
					++partial_matches;
				break; case Match::Full:
					if (partial_matches == 0) {
						return result;
					}
				}
			}
			return Result::none();
		}
	}

	unreachable();
}

/// Rule tree debug printing, like `any(ignore(whitespace), value(literal("end")))`
template<typename T>
std::ostream& operator<<(std::ostream& os, Rule<T> const& rule)
{
	using Type = typename Rule<T>::Type;

	auto const print_arguments = [&](std::string_view name) -> std::ostream& {
		os << name << '(';
		for (auto i = 0u; i < rule.arguments.size(); ++i) {
			if (i > 0) {
				os << ", ";
			}
			os << rule.arguments[i];
		}
		return os << ')';
	};

	switch (rule.type) {
	case Type::Literal:    return os << "literal(" << std::quoted(rule.text) << ')';
	case Type::Numeric:    return os << "numeric";
	case Type::Alphabetic: return os << "alphabetic";
	case Type::Whitespace: return os << "whitespace";
	case Type::Ends_With:  return os << "ends_with(" << std::quoted(rule.text) << ')';
	case Type::Value:      return print_arguments("value");
	case Type::Ignore:     return print_arguments("ignore");
	case Type::Not:        return print_arguments("not");
	case Type::Only:       return print_arguments("only");
	case Type::Both:       return print_arguments("both");
	case Type::Either:     return print_arguments("either");
	case Type::All:        return print_arguments("all");
	case Type::Any:        return print_arguments("any");
	}

	unreachable();
}

#endif // LEXRULE_RULE_HH
