#pragma once

#include <cctype>
#include <optional>
#include <string>

namespace ordermill::json {

// Minimal flat-object extraction (no external dependencies).
// Handles "key": "value" pairs only, which is all the config files use.

inline std::optional<size_t> findValueStart(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::nullopt;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::nullopt;

    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;
    return valueStart;
}

// String value for key, nullopt when the key is absent or not a string
inline std::optional<std::string> extractString(const std::string& json, const std::string& key)
{
    auto valueStart = findValueStart(json, key);
    if (!valueStart.has_value() || *valueStart >= json.size() || json[*valueStart] != '"')
        return std::nullopt;

    auto endQuote = json.find('"', *valueStart + 1);
    if (endQuote == std::string::npos)
        return std::nullopt;

    return json.substr(*valueStart + 1, endQuote - *valueStart - 1);
}

inline bool hasKey(const std::string& json, const std::string& key) { return findValueStart(json, key).has_value(); }

} // namespace ordermill::json
