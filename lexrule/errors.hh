#ifndef LEXRULE_ERRORS_HH
#define LEXRULE_ERRORS_HH

#include <optional>
#include <string>
#include <variant>

#include <lexrule/common.hh>
#include <lexrule/location.hh>

/// Guards that program exits if condition does not hold
void ensure(bool condition, std::string message, Location loc = Location::caller());

/// Marks part of code that was not implemented yet
[[noreturn]] void unimplemented(std::string_view message = {}, Location loc = Location::caller());

/// Marks location that should not be reached
[[noreturn]] void unreachable(Location loc = Location::caller());

/// Error handling related functions and definitions
namespace errors
{
	/// Error without any specific cause attached
	struct No_Signal
	{
	};

	/// When scanner grown window to the end of the buffer
	struct End_Of_Input
	{
		/// Text left without conclusive match, empty when whole buffer was consumed
		std::string_view unmatched;

		/// Byte offset where unmatched text starts
		unsigned offset = 0;
	};

	/// When input ends with text that no rule recognized
	struct Unrecognized_Token
	{
		std::string text;
		unsigned offset = 0;
	};

	/// When user provided path to file that cannot be read
	struct Missing_File
	{
		std::string path;
	};

	/// When grammar description cannot be turned into rules
	struct Invalid_Grammar
	{
		std::string section;
		std::string key;
		std::string reason;
	};

	/// All possible error types
	using Details = std::variant<
		End_Of_Input,
		Invalid_Grammar,
		Missing_File,
		No_Signal,
		Unrecognized_Token
	>;
}

/// Represents all recoverable error messages that library can produce
struct Error
{
	/// Specific message details
	errors::Details details;

	/// Source range that coused all this trouble
	std::optional<File_Range> file = std::nullopt;

	/// Return self with new source range
	Error with(File_Range) &&;
};

/// Error pretty printing
std::ostream& operator<<(std::ostream& os, Error const& err);

#endif // LEXRULE_ERRORS_HH
