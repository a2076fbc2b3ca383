#include "egress/policy/DomainPattern.h"
#include "egress/policy/AddressPolicy.h"

#include <stdexcept>

namespace egress {
namespace policy {

DomainPattern DomainPattern::Exact(const std::string& domain) {
    DomainPattern p;
    p.source_ = AddressPolicy::NormalizeHostname(domain);
    return p;
}

DomainPattern DomainPattern::Regex(const std::string& expression) {
    DomainPattern p;
    p.source_ = expression;
    try {
        p.regex_ = std::make_shared<const std::regex>(expression, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid domain pattern /" + expression + "/: " + e.what());
    }
    return p;
}

DomainPattern DomainPattern::Parse(const std::string& text) {
    if (text.size() >= 2 && text.front() == '/' && text.back() == '/') {
        return Regex(text.substr(1, text.size() - 2));
    }
    return Exact(text);
}

bool DomainPattern::Matches(const std::string& hostname) const {
    const std::string host = AddressPolicy::NormalizeHostname(hostname);
    if (regex_) return std::regex_search(host, *regex_);
    return !source_.empty() && host == source_;
}

} // namespace policy
} // namespace egress
