#include <algorithm>
#include <lexrule/location.hh>
#include <lexrule/unicode.hh>

Location Location::of(std::string_view filename, std::string_view source, unsigned offset)
{
	Location loc;
	loc.filename = filename;

	source = source.substr(0, std::min<usize>(offset, source.size()));
	while (not source.empty()) {
		auto const [rune, rest] = utf8::decode(source);
		loc.advance(rune);
		// Malformed sequences are counted as a single column per byte
		source = rest.size() == source.size() ? source.substr(1) : rest;
	}
	return loc;
}

Location& Location::advance(u32 rune)
{
	switch (rune) {
	case '\n':
		line += 1;
		[[fallthrough]];
	case '\r':
		column = 1;
		return *this;
	}
	column += 1;
	return *this;
}

std::ostream& operator<<(std::ostream& os, Location const& location)
{
	os << location.filename << ':' << location.line << ':' << location.column;
	if (location.function_name.size()) {
		os << ":" <<  location.function_name;
	}
	return os;
}

std::ostream& operator<<(std::ostream& os, File_Range const& range)
{
	return os << range.filename << '[' << range.start << ", " << range.stop << ')';
}

#if defined(__cpp_lib_source_location)
Location Location::caller(std::source_location loc)
{
	return Location { loc.file_name(), loc.line(), loc.column(), loc.function_name() };
}
#elif (__has_builtin(__builtin_FILE) and __has_builtin(__builtin_LINE))
Location Location::caller(char const* file, usize line)
{
	return Location { file, line };
}
#endif
