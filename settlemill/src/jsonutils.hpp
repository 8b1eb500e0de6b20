#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace settlemill::json {

// Flat key-value extraction for deployment and scenario files.
// Objects are expected to be one level deep.

inline size_t findValue(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::string::npos;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::string::npos;

    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;
    return valueStart;
}

inline bool hasKey(const std::string& json, const std::string& key)
{
    return findValue(json, key) != std::string::npos;
}

inline std::string extractString(const std::string& json, const std::string& key, const std::string& fallback = "")
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos || valueStart >= json.size() || json[valueStart] != '"')
        return fallback;

    auto endQuote = json.find('"', valueStart + 1);
    if (endQuote == std::string::npos)
        return fallback;

    return json.substr(valueStart + 1, endQuote - valueStart - 1);
}

// Unsigned integer; a missing key yields the fallback, a malformed one throws
inline uint64_t extractUint(const std::string& json, const std::string& key, uint64_t fallback = 0)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return fallback;

    std::string numStr;
    while (valueStart < json.size() && std::isdigit(static_cast<unsigned char>(json[valueStart]))) {
        numStr += json[valueStart];
        ++valueStart;
    }

    if (numStr.empty())
        throw std::runtime_error("Expected an unsigned integer for \"" + key + "\"");

    return std::stoull(numStr);
}

// Accepts true/false as well as 1/0
inline bool extractBool(const std::string& json, const std::string& key, bool fallback = false)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return fallback;

    if (json.compare(valueStart, 4, "true") == 0 || json.compare(valueStart, 1, "1") == 0)
        return true;
    if (json.compare(valueStart, 5, "false") == 0 || json.compare(valueStart, 1, "0") == 0)
        return false;

    throw std::runtime_error("Expected a boolean for \"" + key + "\"");
}

// Each { ... } block of the array stored under key, in order
inline std::vector<std::string> extractObjects(const std::string& json, const std::string& key)
{
    std::vector<std::string> objects;

    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos || valueStart >= json.size() || json[valueStart] != '[')
        return objects;

    auto arrayEnd = json.find(']', valueStart);
    if (arrayEnd == std::string::npos)
        throw std::runtime_error("Unterminated array for \"" + key + "\"");

    size_t pos = valueStart + 1;
    while (pos < arrayEnd) {
        auto objectStart = json.find('{', pos);
        if (objectStart == std::string::npos || objectStart > arrayEnd)
            break;

        auto objectEnd = json.find('}', objectStart);
        if (objectEnd == std::string::npos)
            throw std::runtime_error("Unterminated object in \"" + key + "\"");

        objects.push_back(json.substr(objectStart, objectEnd - objectStart + 1));
        pos = objectEnd + 1;
    }

    return objects;
}

} // namespace settlemill::json
