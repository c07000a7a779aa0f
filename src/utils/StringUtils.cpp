#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace utils
{

std::string ReplaceAll(std::string str, const std::string& from, const std::string& to)
{
    if (from.empty())
    {
        return str;
    }

    size_t start_pos = 0;
    while ((start_pos = str.find(from, start_pos)) != std::string::npos)
    {
        str.replace(start_pos, from.length(), to);
        start_pos += to.length();
    }
    return str;
}

std::string FillTemplate(const std::string& tmpl, const std::vector<std::pair<std::string, std::string>>& values)
{
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size())
    {
        bool matched = false;
        for (const auto& [token, value] : values)
        {
            if (!token.empty() && tmpl.compare(pos, token.size(), token) == 0)
            {
                out += value;
                pos += token.size();
                matched = true;
                break;
            }
        }
        if (!matched)
        {
            out.push_back(tmpl[pos++]);
        }
    }
    return out;
}

std::string Trim(const std::string& str)
{
    const char* ws = " \t\r\n\v\f";
    size_t first = str.find_first_not_of(ws);
    if (first == std::string::npos)
    {
        return {};
    }
    size_t last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

} // namespace utils
