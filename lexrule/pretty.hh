#ifndef LEXRULE_PRETTY_HH
#define LEXRULE_PRETTY_HH

#include <ostream>

/// Stream manipulators highlighting parts of output.
///
/// Each begin_* is closed with end. Until terminal_mode() is called
/// they print nothing, so output stays plain when redirected.
namespace pretty
{
	std::ostream& begin_error(std::ostream&);
	std::ostream& begin_path(std::ostream&);
	std::ostream& begin_comment(std::ostream&);
	std::ostream& begin_bold(std::ostream&);
	std::ostream& begin_token_kind(std::ostream&);

	std::ostream& end(std::ostream&);

	/// Highlight with ANSI escape sequences
	void terminal_mode();
}

#endif // LEXRULE_PRETTY_HH
