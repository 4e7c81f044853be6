#ifndef LEXRULE_UI_PROGRAM_ARGUMENTS_HH
#define LEXRULE_UI_PROGRAM_ARGUMENTS_HH

#include <optional>
#include <span>
#include <string_view>
#include <vector>

/// Command line interface of lexrule executable
namespace ui::program_arguments
{
	/// Input that will be tokenized, in order of appearance on command line
	struct Run
	{
		enum Type
		{
			File,     ///< path to file, `-` means standard input
			Argument, ///< text provided directly on command line
		} type;

		std::string_view argument;
	};

	/// Consumes next option (with its value if it takes one) from args and executes it.
	///
	/// Returns name of the option when it's not recognized, leaving args untouched.
	/// Option without required value terminates the program.
	std::optional<std::string_view> accept_commandline_argument(std::vector<Run> &runnables, std::span<char const*> &args);

	/// Suggests options with spelling similar to arg
	void print_close_matches(std::string_view arg);

	bool is_tty();

	[[noreturn]]
	void usage();
}

#endif // LEXRULE_UI_PROGRAM_ARGUMENTS_HH
