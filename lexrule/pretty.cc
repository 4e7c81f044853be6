#include <lexrule/pretty.hh>
#include <string_view>

namespace
{
	/// Escape sequences that start each kind of highlighted output
	struct Styles
	{
		std::string_view bold{};
		std::string_view comment{};
		std::string_view end{};
		std::string_view error{};
		std::string_view path{};
		std::string_view token_kind{};
	};

	constexpr Styles Terminal_Styles {
		.bold       = "\x1b[1m",
		.comment    = "\x1b[30;1m",
		.end        = "\x1b[0m",
		.error      = "\x1b[31;1m",
		.path       = "\x1b[34;1m",
		.token_kind = "\x1b[32m",
	};

	Styles current{};
}

std::ostream& pretty::begin_error(std::ostream& os)      { return os << current.error; }
std::ostream& pretty::begin_path(std::ostream& os)       { return os << current.path; }
std::ostream& pretty::begin_comment(std::ostream& os)    { return os << current.comment; }
std::ostream& pretty::begin_bold(std::ostream& os)       { return os << current.bold; }
std::ostream& pretty::begin_token_kind(std::ostream& os) { return os << current.token_kind; }
std::ostream& pretty::end(std::ostream& os)              { return os << current.end; }

void pretty::terminal_mode()
{
	current = Terminal_Styles;
}
