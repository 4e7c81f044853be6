#include <lexrule/rule/leaf.hh>
#include <lexrule/errors.hh>
#include <lexrule/unicode.hh>

Match leaf::literal(std::string_view literal, std::string_view window)
{
	if (window == literal) {
		return Match::Full;
	}
	return literal.starts_with(window) ? Match::Partial : Match::None;
}

Match leaf::numeric(std::string_view window)
{
	return unicode::all_of(window, unicode::is_numeric) ? Match::Full : Match::None;
}

Match leaf::alphabetic(std::string_view window)
{
	return unicode::all_of(window, unicode::is_letter) ? Match::Full : Match::None;
}

Match leaf::whitespace(std::string_view window)
{
	return unicode::all_of(window, unicode::is_space) ? Match::Full : Match::None;
}

Match leaf::ends_with(std::string_view suffix, std::string_view window)
{
	return window.ends_with(suffix) ? Match::Full : Match::None;
}

std::ostream& operator<<(std::ostream& os, Match match)
{
	switch (match) {
	case Match::None:    return os << "no match";
	case Match::Full:    return os << "full match";
	case Match::Partial: return os << "partial match";
	}
	unreachable();
}
