#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "egress/common/noncopyable.h"

namespace egress {
namespace common {

// INI settings store: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys that appear before the first header belong to the "global" section.
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    Config() = default;

    bool Load(const std::string& filename);
    bool LoadFromString(const std::string& iniText);

    std::optional<std::string> LoadedFilename() const;

    bool HasKey(const std::string& section, const std::string& key) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Falls back to the default when the key is missing or malformed.
    int64_t GetInt(const std::string& section, const std::string& key, int64_t defaultVal = 0) const;

    // Accepts true/false, yes/no, on/off, 1/0 (case-insensitive).
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Comma-separated list; items are trimmed and empty items dropped.
    std::vector<std::string> GetList(const std::string& section, const std::string& key) const;

    // Snapshot of one section (empty if absent).
    Section GetSection(const std::string& section) const;

    static std::string Trim(const std::string& s);

private:
    static bool Parse(std::istream& in, std::map<std::string, Section>* out);

    mutable std::mutex mutex_;
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace egress
