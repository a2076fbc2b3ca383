#pragma once

#include <memory>
#include <regex>
#include <string>

namespace egress {
namespace policy {

// Hostname pattern: an exact (case-insensitive) name or an ECMAScript regex that
// matches anywhere in the hostname. Regexes are matched against the lowercased host.
class DomainPattern {
public:
    static DomainPattern Exact(const std::string& domain);

    // Throws std::invalid_argument for an invalid expression.
    static DomainPattern Regex(const std::string& expression);

    // "/expr/" is a regex, anything else an exact name.
    static DomainPattern Parse(const std::string& text);

    bool Matches(const std::string& hostname) const;

    bool isRegex() const { return regex_ != nullptr; }
    const std::string& source() const { return source_; }

private:
    DomainPattern() = default;

    std::string source_;
    std::shared_ptr<const std::regex> regex_;
};

} // namespace policy
} // namespace egress
