#pragma once

#include <string>

namespace lolc::utils {

std::string trim(const std::string& s);

// ASCII only
std::string toLower(std::string s);
std::string toUpper(std::string s);
bool startsWith(const std::string& s, const std::string& prefix);

// Percent-encodes everything outside RFC 3986 unreserved characters
std::string urlEncode(const std::string& s);

} // namespace lolc::utils
