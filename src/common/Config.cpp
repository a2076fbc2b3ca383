#include "egress/common/Config.h"
#include "egress/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace egress {
namespace common {

std::string Config::Trim(const std::string& s) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto start = std::find_if_not(s.begin(), s.end(), isSpace);
    auto end = std::find_if_not(s.rbegin(), s.rend(), isSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::Parse(std::istream& in, std::map<std::string, Section>* out) {
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']') {
                LOG_ERROR << "Config: unterminated section header at line " << lineNo;
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_WARN << "Config: ignoring line " << lineNo << " without '='";
            continue;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (!key.empty()) (*out)[section][key] = value;
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::map<std::string, Section> parsed;
    if (!Parse(file, &parsed)) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::map<std::string, Section> parsed;
    if (!Parse(in, &parsed)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

bool Config::HasKey(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    return sit != settings_.end() && sit->second.count(key) > 0;
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int64_t Config::GetInt(const std::string& section, const std::string& key, int64_t defaultVal) const {
    const std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(val.c_str(), &end, 10);
    if (errno != 0 || end == val.c_str() || *end != '\0') {
        LOG_WARN << "Config: [" << section << "] " << key << " = '" << val << "' is not an integer";
        return defaultVal;
    }
    return static_cast<int64_t>(n);
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    LOG_WARN << "Config: [" << section << "] " << key << " = '" << val << "' is not a boolean";
    return defaultVal;
}

std::vector<std::string> Config::GetList(const std::string& section, const std::string& key) const {
    std::vector<std::string> out;
    const std::string val = GetString(section, key, "");
    std::string cur;
    std::istringstream in(val);
    while (std::getline(in, cur, ',')) {
        cur = Trim(cur);
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

Config::Section Config::GetSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return {};
    return sit->second;
}

} // namespace common
} // namespace egress
