#include <cstdlib>
#include <lexrule/common.hh>
#include <lexrule/errors.hh>
#include <lexrule/user_directory.hh>

static std::filesystem::path home()
{
#ifdef _WIN32
	if (auto home = std::getenv("USERPROFILE")) return home;

	if (auto drive = std::getenv("HOMEDRIVE")) {
		if (auto path = std::getenv("HOMEPATH")) {
			return std::string(drive) + path;
		}
	}
#else
	if (auto home = std::getenv("HOME")) {
		return home;
	}
#endif

	unimplemented("Neither HOME nor USERPROFILE enviroment variable are defined");
}

/// Returns directory from environment variable or fallback relative to home
static std::filesystem::path from_environment(char const* variable, auto &&fallback)
{
	if (auto dir = std::getenv(variable)) {
		return dir;
	}
	return fallback();
}

std::filesystem::path user_directory::data_home()
{
#if defined(_WIN32)
	auto path = from_environment("LOCALAPPDATA", [] { return home() / "AppData" / "Local"; });
#elif defined(__APPLE__)
	auto path = home() / "Library";
#else
	auto path = from_environment("XDG_DATA_HOME", [] { return home() / ".local" / "share"; });
#endif

	path /= "lexrule";
	std::filesystem::create_directories(path);
	return path;
}

std::filesystem::path user_directory::config_home()
{
#if defined(_WIN32)
	auto path = from_environment("LOCALAPPDATA", [] { return home() / "AppData" / "Local"; });
#elif defined(__APPLE__)
	auto path = home() / "Library" / "Preferences";
#else
	auto path = from_environment("XDG_CONFIG_HOME", [] { return home() / ".config"; });
#endif

	return path / "lexrule";
}
