#pragma once

#include <string>
#include <utility>
#include <vector>

namespace utils
{

// Replace every occurrence of from with to
std::string ReplaceAll(std::string str, const std::string& from, const std::string& to);

// Substitute every token in one left-to-right pass. Text coming from a value
// is never scanned again, so values may contain token-like text.
std::string FillTemplate(const std::string& tmpl, const std::vector<std::pair<std::string, std::string>>& values);

// Strip leading and trailing whitespace (space, tab, CR, LF, VT, FF)
std::string Trim(const std::string& str);

bool EqualsIgnoreCase(const std::string& a, const std::string& b);

} // namespace utils
