#ifndef LEXRULE_GRAMMAR_HH
#define LEXRULE_GRAMMAR_HH

#include <lexrule/config.hh>
#include <lexrule/grammar/token.hh>
#include <lexrule/result.hh>
#include <lexrule/rule/rule.hh>

/// Building rule trees from grammar descriptions
///
/// Grammar is an INI document with three sections:
///   [lexer]    ignore = comma separated class expressions skipped without producing tokens
///   [keywords] Kind = comma separated literal alternatives, earlier alternatives win
///   [classes]  Kind = class expression
///
/// Class expression is one or more terms joined with `&`, where term is one of
/// `alphabetic`, `numeric`, `whitespace`, `ends_with:<suffix>`, optionally negated with `!`.
///
/// Resulting rule is `any(ignored..., keywords..., classes...)` in order of appearance.
/// Multiple terms of ignored expression are joined with `both`, of class expression with `all`.
namespace grammar
{
	/// Source of the grammar used when user doesn't provide any
	std::string_view builtin_source();

	/// Rules for builtin grammar
	Rule<Token> builtin();

	/// Build rules from parsed grammar description
	Result<Rule<Token>> build(config::Sections const& sections);

	/// Build rules for terms of class expression, like `alphabetic & !ends_with:s`
	Result<std::vector<Rule<Token>>> class_terms(std::string_view expression);
}

#endif // LEXRULE_GRAMMAR_HH
