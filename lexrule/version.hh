#ifndef LEXRULE_VERSION_HH
#define LEXRULE_VERSION_HH

#include <string_view>

/// Version following Semantic Versioning
constexpr std::string_view Lexrule_Version = "0.1.0";

#endif // LEXRULE_VERSION_HH
