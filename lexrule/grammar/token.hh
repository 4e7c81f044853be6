#ifndef LEXRULE_GRAMMAR_TOKEN_HH
#define LEXRULE_GRAMMAR_TOKEN_HH

#include <lexrule/common.hh>
#include <ostream>

/// Token produced by grammars described in configuration files
struct Token
{
	/// Name of the grammar entry that produced the token, like "Function" or "Identifier"
	std::string kind;

	/// Matched source
	std::string source;

	bool operator==(Token const&) const = default;
};

/// Token debug printing
std::ostream& operator<<(std::ostream& os, Token const& tok);

#endif // LEXRULE_GRAMMAR_TOKEN_HH
