#include <boost/ut.hpp>
#include <lexrule/errors.hh>
#include <lexrule/grammar/grammar.hh>
#include <lexrule/lines.hh>
#include <lexrule/result.hh>
#include <lexrule/scanner/scanner.hh>
#include <lexrule/try.hh>

#include <sstream>

using namespace boost::ut;

static std::string print(Error const& error)
{
	std::stringstream ss;
	ss << error;
	return std::move(ss).str();
}

static void expect_contains(
		std::string_view text,
		std::string_view expected,
		reflection::source_location const& sl = reflection::source_location::current())
{
	expect(text.find(expected) != std::string_view::npos, sl) << "expected" << expected << "inside of" << text;
}

static Result<int> parse_digit(char c)
{
	if (c < '0' || c > '9') {
		return errors::No_Signal{};
	}
	return c - '0';
}

static Result<int> sum_digits(std::string_view digits)
{
	int sum = 0;
	for (char c : digits) {
		sum += Try(parse_digit(c));
	}
	return sum;
}

suite errors_test = [] {
	"Unrecognized token shows offending line"_test = [] {
		Lines::the.add_file("errors-test", "local x\nx := ?\n");
		auto const error = Error {
			.details = errors::Unrecognized_Token { .text = "?", .offset = 13 },
			.file = File_Range { "errors-test", 13, 14 },
		};

		auto const message = print(error);
		expect_contains(message, "Unrecognized token at errors-test:2:6");
		expect_contains(message, "  2 | x := ?");
		expect_contains(message, "'?' at byte 13");
	};

	"Tokenize error points at unmatched text"_test = [] {
		static constexpr std::string_view source = "\nfunction add(a, b)\n";
		auto const rule = grammar::builtin();

		auto const unregistered = tokenize(rule, source, { .filename = "tokenize-unregistered" });
		expect(unregistered.holds_error<errors::Unrecognized_Token>() >> fatal);
		auto const range_message = print(unregistered.error());
		expect_contains(range_message, "Unrecognized token at tokenize-unregistered[12, 20)");
		expect_contains(range_message, "'d(a, b)\n' at byte 12");

		Lines::the.add_file("tokenize-registered", source);
		auto const registered = tokenize(rule, source, { .filename = "tokenize-registered" });
		expect(registered.holds_error<errors::Unrecognized_Token>() >> fatal);
		auto const line_message = print(registered.error());
		expect_contains(line_message, "Unrecognized token at tokenize-registered:2:12");
		expect_contains(line_message, "  2 | function add(a, b)");
	};

	"Invalid grammar names entry"_test = [] {
		auto const message = print(Error {
			.details = errors::Invalid_Grammar { .section = "classes", .key = "Word", .reason = "unknown class 'letters'" },
		});
		expect_contains(message, "Invalid grammar");
		expect_contains(message, "[classes] entry 'Word'");
		expect_contains(message, "unknown class 'letters'");
	};

	"Missing file"_test = [] {
		auto const message = print(Error { .details = errors::Missing_File { .path = "nope.lua" } });
		expect_contains(message, "Cannot read file");
		expect_contains(message, "nope.lua");
	};

	"Error range"_test = [] {
		auto error = Error { .details = errors::No_Signal{} }.with(File_Range { "f", 1, 2 });
		expect(error.file == File_Range { "f", 1, 2 });

		Result<int> result = errors::No_Signal{};
		auto const ranged = std::move(result).with(File_Range { "g", 3, 4 });
		expect(ranged.holds_error<errors::No_Signal>() >> fatal);
		expect(ranged.error().file == File_Range { "g", 3, 4 });
	};

	"Try forwards errors"_test = [] {
		auto const ok = sum_digits("123");
		expect(ok.has_value() >> fatal);
		expect(eq(*ok, 6));

		auto const failed = sum_digits("1x3");
		expect(failed.holds_error<errors::No_Signal>());
	};
};
