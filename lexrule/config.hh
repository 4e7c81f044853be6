#ifndef LEXRULE_CONFIG_HH
#define LEXRULE_CONFIG_HH

#include <lexrule/result.hh>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Parses INI files
//
// Sections and keys keep order of their appearance in the file,
// since grammar rules depend on it.
namespace config
{
	using Key_Value = std::vector<std::pair<std::string, std::string>>;
	using Sections  = std::vector<std::pair<std::string, Key_Value>>;

	/// Parse INI source. Keys before first section land in section named ""
	Sections parse(std::string_view source);

	Result<Sections> from_file(std::filesystem::path const& path);

	/// Find section by name
	Key_Value const* find(Sections const& sections, std::string_view section);

	/// Find value by key
	std::optional<std::string_view> find(Key_Value const& kv, std::string_view key);

	/// Default grammar location inside user configuration directory
	std::filesystem::path location();
}

#endif // LEXRULE_CONFIG_HH
