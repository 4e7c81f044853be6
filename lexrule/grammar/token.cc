#include <lexrule/grammar/token.hh>
#include <iomanip>

std::ostream& operator<<(std::ostream& os, Token const& token)
{
	return os << token.kind << '(' << std::quoted(token.source) << ')';
}
