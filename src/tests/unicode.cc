#include <boost/ut.hpp>
#include <lexrule/location.hh>
#include <lexrule/unicode.hh>

#include <sstream>

using namespace boost::ut;

suite utf8_test = [] {
	"UTF-8 Character length"_test = [] {
		expect(utf8::length(" ")          == 1_u);
		expect(utf8::length("ą")          == 2_u);
		expect(utf8::length("✅")     == 3_u);
		expect(utf8::length("\U000132d1") == 4_u);
		expect(utf8::length("\x80")       == 0_u);
		expect(utf8::length("")           == 0_u);
	};

	"UTF-8 Character decoding"_test = [] {
		expect(eq(utf8::decode(" ").first,          0x20u));
		expect(eq(utf8::decode("ą").first,          0x105u));
		expect(eq(utf8::decode("✅").first,     0x2705u));
		expect(eq(utf8::decode("\U000132d1").first, 0x132d1u));
		expect(eq(utf8::decode("ąb").second,        "b"sv));
	};

	"UTF-8 Malformed decoding"_test = [] {
		auto const [truncated, truncated_rest] = utf8::decode("\xc5");
		expect(eq(truncated, utf8::Rune_Error));
		expect(eq(truncated_rest, "\xc5"sv)) << "malformed input must not be consumed";

		auto const [broken, broken_rest] = utf8::decode("\xc5x");
		expect(eq(broken, utf8::Rune_Error));
		expect(eq(broken_rest.size(), 2u));
	};
};

suite unicode_classes_test = [] {
	"Letters"_test = [] {
		expect(unicode::is_letter('a'));
		expect(unicode::is_letter('Z'));
		expect(unicode::is_letter(0x105u)) << "ą";
		expect(unicode::is_letter(0x3b1u)) << "α";
		expect(unicode::is_letter(0x4e2du)) << "中";
		expect(!unicode::is_letter('1'));
		expect(!unicode::is_letter('_'));
		expect(!unicode::is_letter(' '));
	};

	"Numerics"_test = [] {
		expect(unicode::is_numeric('0'));
		expect(unicode::is_numeric('9'));
		expect(unicode::is_numeric(0x663u)) << "Arabic-Indic three";
		expect(unicode::is_numeric(0xb2u)) << "superscript two";
		expect(!unicode::is_numeric('a'));
	};

	"Spaces"_test = [] {
		for (u32 space : { ' ', '\t', '\n', '\r', '\v', '\f' }) {
			expect(unicode::is_space(space));
		}
		expect(unicode::is_space(0xa0u))   << "no-break space";
		expect(unicode::is_space(0x3000u)) << "ideographic space";
		expect(!unicode::is_space('x'));
	};

	"All of"_test = [] {
		expect(unicode::all_of("", unicode::is_letter));
		expect(unicode::all_of("zażółć", unicode::is_letter));
		expect(!unicode::all_of("ab1", unicode::is_letter));
		expect(!unicode::all_of("a\xff", unicode::is_letter));
	};

	"Trim"_test = [] {
		std::string_view s = "  key = value \t";
		trim(s);
		expect(eq(s, "key = value"sv));

		std::string_view spaces = "   ";
		trim(spaces);
		expect(spaces.empty());
	};
};

suite location_test = [] {
	"Location of offset"_test = [] {
		std::string_view const source = "local x\nżółw end\n";
		expect(Location::of("f", source, 0) == Location { "f", 1, 1 });
		expect(Location::of("f", source, 6) == Location { "f", 1, 7 });
		expect(Location::of("f", source, 8) == Location { "f", 2, 1 });
		// Columns are counted in code points
		expect(Location::of("f", source, 15) == Location { "f", 2, 5 });
		expect(Location::of("f", source, 1000) == Location { "f", 3, 1 });
	};

	"Location printing"_test = [] {
		std::stringstream ss;
		ss << Location { "input.lua", 2, 5 } << ' ' << File_Range { "input.lua", 3, 7 };
		expect(eq(ss.str(), "input.lua:2:5 input.lua[3, 7)"sv));
		expect(!File_Range{}) << "range without file name is empty";
	};
};
