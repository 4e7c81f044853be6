#ifndef LEXRULE_USER_DIRECTORY_HH
#define LEXRULE_USER_DIRECTORY_HH

#include <filesystem>

/// Per user directories of lexrule, following XDG Base Directory layout on Unix
namespace user_directory
{
	/// Directory for data like interactive mode history, created on first use.
	/// `$XDG_DATA_HOME/lexrule` on Unix.
	std::filesystem::path data_home();

	/// Directory searched for `grammar.ini`, not created.
	/// `$XDG_CONFIG_HOME/lexrule` on Unix.
	std::filesystem::path config_home();
}

#endif // LEXRULE_USER_DIRECTORY_HH
