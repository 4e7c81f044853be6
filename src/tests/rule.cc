#include <boost/ut.hpp>
#include <lexrule/rule/rule.hh>

#include <sstream>

using namespace boost::ut;

using Text_Rule = Rule<std::string>;

static std::string copy(std::string_view source)
{
	return std::string(source);
}

static std::string upper(std::string_view source)
{
	std::string result(source);
	for (auto &c : result) {
		if (c >= 'a' && c <= 'z') c = c - 'a' + 'A';
	}
	return result;
}

static void expect_match(
		Text_Rule const& rule,
		std::string_view window,
		Match expected,
		reflection::source_location const& sl = reflection::source_location::current())
{
	auto const result = rule.matches(window);
	expect(eq(result.type, expected), sl) << "window" << window << "was classified differently";
	if (expected != Match::Full) {
		expect(!result.value.has_value(), sl) << "only full matches can produce values";
	}
}

static void expect_value(
		Text_Rule const& rule,
		std::string_view window,
		std::string_view expected,
		reflection::source_location const& sl = reflection::source_location::current())
{
	auto const result = rule.matches(window);
	expect(eq(result.type, Match::Full) >> fatal, sl) << "expected full match of" << window;
	expect(result.value.has_value() >> fatal, sl) << "full match didn't produce any value";
	expect(eq(*result.value, expected), sl) << "produced value is different then expected";
}

suite leaf_rules_test = [] {
	"Literal"_test = [] {
		auto const end = Text_Rule::literal("end");
		expect_match(end, "e",     Match::Partial);
		expect_match(end, "en",    Match::Partial);
		expect_match(end, "end",   Match::Full);
		expect_match(end, "ended", Match::None);
		expect_match(end, "and",   Match::None);
		expect(!end.matches("end").value.has_value()) << "literal doesn't produce values";
	};

	"Numeric"_test = [] {
		auto const number = Text_Rule::numeric();
		expect_match(number, "1",    Match::Full);
		expect_match(number, "1234", Match::Full);
		expect_match(number, "12a",  Match::None);
		expect_match(number, "١٢٣",  Match::Full);
	};

	"Alphabetic"_test = [] {
		auto const letters = Text_Rule::alphabetic();
		expect_match(letters, "cat",    Match::Full);
		expect_match(letters, "zażółć", Match::Full);
		expect_match(letters, "cat1",   Match::None);
		expect_match(letters, "a b",    Match::None);
	};

	"Whitespace"_test = [] {
		auto const space = Text_Rule::whitespace();
		expect_match(space, " ",      Match::Full);
		expect_match(space, " \t\n ", Match::Full);
		expect_match(space, " x",     Match::None);
	};

	"Ends with never matches partially"_test = [] {
		auto const plural = Text_Rule::ends_with("s");
		expect_match(plural, "cats", Match::Full);
		expect_match(plural, "s",    Match::Full);
		expect_match(plural, "cat",  Match::None);
		expect_match(plural, "sa",   Match::None);
	};

	"Empty window"_test = [] {
		expect_match(Text_Rule::literal("end"), "", Match::Partial);
		expect_match(Text_Rule::alphabetic(),   "", Match::Full);
		expect_match(Text_Rule::ends_with("s"), "", Match::None);
	};

	"Malformed UTF-8 is not a class member"_test = [] {
		expect_match(Text_Rule::alphabetic(), "a\xff", Match::None);
		expect_match(Text_Rule::numeric(),    "\xc5",  Match::None);
	};
};

suite composite_rules_test = [] {
	"Value"_test = [] {
		auto const end = Text_Rule::value(Text_Rule::literal("end"), upper);
		expect_match(end, "en", Match::Partial);
		expect_value(end, "end", "END");
		expect_match(end, "ended", Match::None);
	};

	"Ignore"_test = [] {
		auto const space = Text_Rule::ignore(Text_Rule::value(Text_Rule::whitespace(), copy));
		auto const result = space.matches("  ");
		expect(eq(result.type, Match::Full));
		expect(!result.value.has_value()) << "ignored rule produced value";

		expect_match(Text_Rule::ignore(Text_Rule::literal("--")), "-", Match::Partial);
		expect_match(Text_Rule::ignore(Text_Rule::literal("--")), "+", Match::None);
	};

	"Not"_test = [] {
		auto const not_number = Text_Rule::negate(Text_Rule::numeric());
		expect_match(not_number, "abc", Match::Full);
		expect_match(not_number, "123", Match::None);

		// Partial match of the child is still a match
		auto const not_end = Text_Rule::negate(Text_Rule::literal("end"));
		expect_match(not_end, "en",  Match::None);
		expect_match(not_end, "end", Match::None);
		expect_match(not_end, "x",   Match::Full);
	};

	"Only"_test = [] {
		auto const grouped = Text_Rule::only(Text_Rule::value(Text_Rule::literal("do"), copy));
		expect_match(grouped, "d", Match::Partial);
		expect_value(grouped, "do", "do");
	};

	"Both"_test = [] {
		auto const rule = Text_Rule::both(
			Text_Rule::value(Text_Rule::alphabetic(), upper),
			Text_Rule::ends_with("s"));

		expect_value(rule, "cats", "CATS");
		expect_match(rule, "cat",  Match::None);
		expect_match(rule, "12s",  Match::None);

		// Partial match is not enough for conjunction
		expect_match(Text_Rule::both(Text_Rule::literal("end"), Text_Rule::alphabetic()), "en", Match::None);
	};

	"Either defers to partially matching first alternative"_test = [] {
		auto const function = Text_Rule::either(Text_Rule::literal("function"), Text_Rule::literal("func"));
		expect_match(function, "func",     Match::Partial);
		expect_match(function, "function", Match::Full);
		expect_match(function, "x",        Match::None);

		expect_match(Text_Rule::literal("func"), "func", Match::Full);

		auto const swapped = Text_Rule::either(Text_Rule::literal("func"), Text_Rule::literal("function"));
		expect_match(swapped, "func",  Match::Full);
		expect_match(swapped, "funct", Match::Partial);
	};

	"All"_test = [] {
		auto const plural = Text_Rule::all({ Text_Rule::alphabetic(), Text_Rule::ends_with("s") }, upper);
		expect_value(plural, "cats", "CATS");
		expect_match(plural, "cat", Match::None);

		auto const prefixed = Text_Rule::all({ Text_Rule::literal("end"), Text_Rule::alphabetic() }, copy);
		expect_match(prefixed, "en", Match::Partial);
		expect_value(prefixed, "end", "end");
	};

	"Any prefers earliest full match without earlier partials"_test = [] {
		auto const rule = Text_Rule::any({
			Text_Rule::value(Text_Rule::literal("or"), upper),
			Text_Rule::value(Text_Rule::alphabetic(), copy),
		});

		expect_match(rule, "o", Match::None);
		expect_value(rule, "or", "OR");
		expect_value(rule, "org", "org");
		expect_value(rule, "organization", "organization");
	};

	"Any never reports partial match"_test = [] {
		auto const rule = Text_Rule::any({
			Text_Rule::value(Text_Rule::literal("end"), copy),
			Text_Rule::value(Text_Rule::literal("else"), copy),
		});
		expect_match(rule, "e",   Match::None);
		expect_match(rule, "en",  Match::None);
		expect_value(rule, "end", "end");
		expect_match(Text_Rule::any({}), "x", Match::None);
	};

	"Matching is deterministic"_test = [] {
		auto const rule = Text_Rule::any({
			Text_Rule::ignore(Text_Rule::whitespace()),
			Text_Rule::value(Text_Rule::either(Text_Rule::literal("function"), Text_Rule::literal("func")), upper),
			Text_Rule::all({ Text_Rule::alphabetic(), Text_Rule::negate(Text_Rule::ends_with("_")) }, copy),
		});

		for (std::string_view window : { "", " ", "f", "func", "function", "functions", "x_", "12" }) {
			auto const first = rule.matches(window);
			auto const second = rule.matches(window);
			expect(first == second) << "different results for" << window;
		}
	};
};

suite rule_printing_test = [] {
	"Rule tree printing"_test = [] {
		auto const rule = Text_Rule::any({
			Text_Rule::ignore(Text_Rule::whitespace()),
			Text_Rule::value(Text_Rule::literal("end"), copy),
			Text_Rule::all({ Text_Rule::alphabetic(), Text_Rule::negate(Text_Rule::ends_with("s")) }, copy),
		});

		std::stringstream ss;
		ss << rule;
		expect(eq(ss.str(), std::string(R"(any(ignore(whitespace), value(literal("end")), all(alphabetic, not(ends_with("s")))))")));
	};

	"Match printing"_test = [] {
		std::stringstream ss;
		ss << Match::None << ", " << Match::Partial << ", " << Match::Full;
		expect(eq(ss.str(), "no match, partial match, full match"sv));
	};
};
