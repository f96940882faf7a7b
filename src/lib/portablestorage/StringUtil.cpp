#include <cctype>
#include <random>

#include "StringUtil.hpp"

namespace PortableStorage {

/*****************************************************/
std::string StringUtil::Random(const size_t size)
{
    static const std::string chars { "0123456789abcdefghijklmnopqrstuvwxyz" };

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size()-1);

    std::string retval(size, '\0');
    for (char& ch : retval) ch = chars[dist(rng)];
    return retval;
}

/*****************************************************/
StringUtil::StringList StringUtil::explode(
    const std::string& str, const std::string& delim, const bool reverse, const size_t max)
{
    if (str.empty()) return { };
    if (delim.empty() || max <= 1) return { str };

    StringList retval;
    if (!reverse)
    {
        size_t start { 0 };
        while (retval.size()+1 < max)
        {
            const size_t pos { str.find(delim, start) };
            if (pos == std::string::npos) break;

            retval.push_back(str.substr(start, pos-start));
            start = pos + delim.size();
        }
        retval.push_back(str.substr(start));
    }
    else
    {
        size_t end { str.size() }; // one past the current piece
        while (retval.size()+1 < max && end >= delim.size())
        {
            const size_t pos { str.rfind(delim, end-delim.size()) };
            if (pos == std::string::npos) break;

            retval.insert(retval.begin(), str.substr(pos+delim.size(), end-pos-delim.size()));
            end = pos;
        }
        retval.insert(retval.begin(), str.substr(0, end));
    }
    return retval;
}

/*****************************************************/
StringUtil::StringPair StringUtil::split(
    const std::string& str, const std::string& delim, const bool reverse)
{
    const StringList pieces { explode(str, delim, reverse, 2) };

    if (pieces.size() == 2) return { pieces[0], pieces[1] };
    else if (pieces.empty()) return { "", "" };
    else if (reverse) return { "", pieces[0] };
    else return { pieces[0], "" };
}

/*****************************************************/
StringUtil::StringPair StringUtil::splitPath(const std::string& path)
{
    size_t end { path.size() };
    while (end > 1 && path[end-1] == '/') --end; // trailing /
    
    return split(path.substr(0, end), "/", true);
}

/*****************************************************/
StringUtil::StringPair StringUtil::splitExtension(const std::string& name)
{
    const size_t dot { name.rfind('.') };
    if (dot == std::string::npos || dot == 0)
        return { name, "" };

    return { name.substr(0, dot), name.substr(dot) };
}

/*****************************************************/
std::string StringUtil::trim(const std::string& str)
{
    const auto isSpace { [](char ch){ return std::isspace(static_cast<unsigned char>(ch)) != 0; } };

    size_t start { 0 }, end { str.size() };
    while (start < end && isSpace(str[start])) ++start;
    while (end > start && isSpace(str[end-1])) --end;

    return str.substr(start, end-start);
}

} // namespace PortableStorage
