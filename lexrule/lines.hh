#ifndef LEXRULE_LINES_HH
#define LEXRULE_LINES_HH

#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/// Registry of scanned sources, used to show offending lines in error messages
struct Lines
{
	static Lines the;

	/// Sources by their file names
	std::unordered_map<std::string, std::string_view> sources;

	/// Region of lines in files
	std::unordered_map<std::string, std::vector<std::string_view>> lines;

	/// Add lines from file
	void add_file(std::string filename, std::string_view source);

	/// Returns source registered under filename, empty if there is none
	std::string_view source(std::string const& filename) const;

	/// Print selected region
	void print(std::ostream& os, std::string const& file, unsigned first_line, unsigned last_line) const;
};

#endif
