#include <algorithm>
#include <array>
#include <lexrule/unicode.hh>

static constexpr std::array<u8, 4> payloads {
	0b0111'1111, 0b0001'1111, 0b0000'1111, 0b0000'0111
};

static constexpr std::array<u8, 4> patterns {
	0b0000'0000, 0b1100'0000, 0b1110'0000, 0b1111'0000
};

constexpr auto payload_cont  = 0b0011'1111;
constexpr auto pattern_cont  = 0b1000'0000;

auto utf8::length(std::string_view s) -> usize
{
	if (not s.empty()) {
		for (auto i = 0u; i < payloads.size(); ++i) {
			if ((u8(s.front()) & ~payloads[i]) == patterns[i]) {
				return i+1;
			}
		}
	}
	return 0;
}

auto utf8::decode(std::string_view s) -> std::pair<u32, std::string_view>
{
	usize const length = utf8::length(s);

	if (length == 0 || s.size() < length) {
		return { utf8::Rune_Error, s };
	}

	u32 result = u8(s.front()) & payloads[length-1];

	for (auto i = 1u; i < length; ++i) {
		if ((u8(s[i]) & ~payload_cont) != pattern_cont) {
			return { utf8::Rune_Error, s };
		}
		result <<= 6;
		result |= u32(u8(s[i]) & payload_cont);
	}

	return { result, s.substr(length) };
}

namespace
{
	/// Inclusive range of runes
	struct Rune_Range
	{
		u32 first, last;
	};

	/// Tests if rune belongs to one of sorted, non-overlapping ranges
	template<usize N>
	bool in_ranges(std::array<Rune_Range, N> const& ranges, u32 rune)
	{
		auto it = std::upper_bound(ranges.begin(), ranges.end(), rune,
			[](u32 rune, Rune_Range const& range) { return rune < range.first; });
		return it != ranges.begin() && rune <= std::prev(it)->last;
	}

	constexpr auto Letters = std::array {
		Rune_Range { 0x0041, 0x005a }, // Basic Latin
		Rune_Range { 0x0061, 0x007a },
		Rune_Range { 0x00aa, 0x00aa }, // Latin-1 Supplement
		Rune_Range { 0x00b5, 0x00b5 },
		Rune_Range { 0x00ba, 0x00ba },
		Rune_Range { 0x00c0, 0x00d6 },
		Rune_Range { 0x00d8, 0x00f6 },
		Rune_Range { 0x00f8, 0x02c1 }, // Latin Extended A, B and IPA
		Rune_Range { 0x0370, 0x0373 }, // Greek
		Rune_Range { 0x0376, 0x0377 },
		Rune_Range { 0x037b, 0x037d },
		Rune_Range { 0x0386, 0x0386 },
		Rune_Range { 0x0388, 0x038a },
		Rune_Range { 0x038c, 0x038c },
		Rune_Range { 0x038e, 0x03a1 },
		Rune_Range { 0x03a3, 0x03f5 },
		Rune_Range { 0x03f7, 0x0481 }, // Cyrillic
		Rune_Range { 0x048a, 0x052f },
		Rune_Range { 0x0531, 0x0556 }, // Armenian
		Rune_Range { 0x0561, 0x0587 },
		Rune_Range { 0x05d0, 0x05ea }, // Hebrew
		Rune_Range { 0x0620, 0x064a }, // Arabic
		Rune_Range { 0x0904, 0x0939 }, // Devanagari
		Rune_Range { 0x1e00, 0x1f15 }, // Latin Extended Additional, Greek Extended
		Rune_Range { 0x1f18, 0x1f1d },
		Rune_Range { 0x1f20, 0x1f45 },
		Rune_Range { 0x1f48, 0x1f4d },
		Rune_Range { 0x1f50, 0x1f57 },
		Rune_Range { 0x1f59, 0x1f7d },
		Rune_Range { 0x1f80, 0x1fb4 },
		Rune_Range { 0x3041, 0x3096 }, // Hiragana
		Rune_Range { 0x30a1, 0x30fa }, // Katakana
		Rune_Range { 0x4e00, 0x9fff }, // CJK Unified Ideographs
		Rune_Range { 0xac00, 0xd7a3 }, // Hangul Syllables
		Rune_Range { 0xff21, 0xff3a }, // Fullwidth Latin
		Rune_Range { 0xff41, 0xff5a },
	};

	constexpr auto Numerics = std::array {
		Rune_Range { 0x0030, 0x0039 },
		Rune_Range { 0x00b2, 0x00b3 }, // Superscripts
		Rune_Range { 0x00b9, 0x00b9 },
		Rune_Range { 0x00bc, 0x00be }, // Vulgar fractions
		Rune_Range { 0x0660, 0x0669 }, // Arabic-Indic
		Rune_Range { 0x06f0, 0x06f9 }, // Extended Arabic-Indic
		Rune_Range { 0x0966, 0x096f }, // Devanagari
		Rune_Range { 0x2070, 0x2070 }, // Superscripts and Subscripts
		Rune_Range { 0x2074, 0x2079 },
		Rune_Range { 0x2080, 0x2089 },
		Rune_Range { 0x2150, 0x2189 }, // Number Forms
		Rune_Range { 0x2460, 0x249b }, // Enclosed Alphanumerics
		Rune_Range { 0xff10, 0xff19 }, // Fullwidth digits
	};

	constexpr auto Spaces = std::array {
		Rune_Range { 0x0009, 0x000d },
		Rune_Range { 0x0020, 0x0020 },
		Rune_Range { 0x0085, 0x0085 },
		Rune_Range { 0x00a0, 0x00a0 },
		Rune_Range { 0x1680, 0x1680 },
		Rune_Range { 0x2000, 0x200a },
		Rune_Range { 0x2028, 0x2029 },
		Rune_Range { 0x202f, 0x202f },
		Rune_Range { 0x205f, 0x205f },
		Rune_Range { 0x3000, 0x3000 },
	};
}

bool unicode::is_numeric(u32 rune)
{
	return in_ranges(Numerics, rune);
}

bool unicode::is_space(u32 space)
{
	return in_ranges(Spaces, space);
}

bool unicode::is_letter(u32 letter)
{
	return in_ranges(Letters, letter);
}

bool unicode::all_of(std::string_view s, bool(*predicate)(u32))
{
	while (not s.empty()) {
		auto const [rune, rest] = utf8::decode(s);
		if (rest.size() == s.size() || not predicate(rune)) {
			return false;
		}
		s = rest;
	}
	return true;
}

void trim(std::string_view &s)
{
	// left trim
	if (auto const i = std::find_if_not(s.begin(), s.end(), unicode::is_space); i != s.begin()) {
		// std::string_view::remove_prefix has UB when we wan't to remove more characters then str has
		// src: https://en.cppreference.com/w/cpp/string/basic_string_view/remove_prefix
		if (i != s.end()) {
			s.remove_prefix(std::distance(s.begin(), i));
		} else {
			s = {};
		}
	}

	// right trim
	if (auto const ws_end = std::find_if_not(s.rbegin(), s.rend(), unicode::is_space); ws_end != s.rbegin()) {
		s.remove_suffix(std::distance(ws_end.base(), s.end()));
	}
}
