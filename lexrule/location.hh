#ifndef LEXRULE_LOCATION_HH
#define LEXRULE_LOCATION_HH

#if __has_include(<source_location>)
#include <source_location>
#endif

#include <lexrule/common.hh>
#include <ostream>

/// Half open byte range [start, stop) inside of a named source
struct File_Range
{
	std::string_view filename{};
	unsigned start = 0;
	unsigned stop  = 0;

	/// Range is meaningful only when it names its source
	explicit inline operator bool() const { return not filename.empty(); }

	bool operator==(File_Range const&) const = default;
};

/// Human readable position, `file:line:column`, either in scanned source
/// or in library code (see Location::caller)
struct Location
{
	std::string_view filename = "<unnamed>";
	usize line   = 1; ///< 1 based
	usize column = 1; ///< 1 based, counted in code points
	std::string_view function_name = "";

	/// Moves to the next column, or to the begining of the next line after newline
	Location& advance(u32 rune);

	bool operator==(Location const& rhs) const = default;

	/// Resolves byte offset inside source to line and column
	static Location of(std::string_view filename, std::string_view source, unsigned offset);

#if defined(__cpp_lib_source_location)
	static Location caller(std::source_location loc = std::source_location::current());
#elif (__has_builtin(__builtin_FILE) and __has_builtin(__builtin_LINE))
	static Location caller(char const* file = __builtin_FILE(), usize line = __builtin_LINE());
#else
#error Cannot implement Location::caller function
#endif
};

std::ostream& operator<<(std::ostream& os, Location const& location);

/// Prints range as `file[start, stop)`
std::ostream& operator<<(std::ostream& os, File_Range const& range);

#endif // LEXRULE_LOCATION_HH
