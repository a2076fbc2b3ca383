#include "egress/fetch/Multipart.h"

#include <cctype>
#include <map>
#include <random>
#include <sstream>

namespace egress {
namespace fetch {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    size_t j = s.size();
    while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t')) --j;
    return s.substr(i, j - i);
}

// Quoted-string escaping used by browsers for form-data names.
std::string EscapeName(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"') out += "%22";
        else if (c == '\r') out += "%0D";
        else if (c == '\n') out += "%0A";
        else out.push_back(c);
    }
    return out;
}

std::string UnescapeName(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const std::string code = ToLowerCopy(s.substr(i + 1, 2));
            if (code == "22") { out.push_back('"'); i += 2; continue; }
            if (code == "0d") { out.push_back('\r'); i += 2; continue; }
            if (code == "0a") { out.push_back('\n'); i += 2; continue; }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Splits `a=b; c="d;e"` style parameter lists, honoring quotes.
std::map<std::string, std::string> ParseParams(const std::string& v, std::string* head) {
    std::map<std::string, std::string> params;
    std::vector<std::string> items;
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '"') quoted = !quoted;
        if (c == ';' && !quoted) {
            items.push_back(cur);
            cur.clear();
            continue;
        }
        if (c == '\\' && quoted && i + 1 < v.size()) {
            cur.push_back(c);
            cur.push_back(v[++i]);
            continue;
        }
        cur.push_back(c);
    }
    items.push_back(cur);

    if (head) *head = ToLowerCopy(Trim(items.front()));
    for (size_t i = 1; i < items.size(); ++i) {
        const std::string item = Trim(items[i]);
        const size_t eq = item.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = ToLowerCopy(Trim(item.substr(0, eq)));
        std::string val = Trim(item.substr(eq + 1));
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            std::string unq;
            for (size_t k = 1; k + 1 < val.size(); ++k) {
                if (val[k] == '\\' && k + 2 < val.size()) ++k;
                unq.push_back(val[k]);
            }
            val = unq;
        }
        params[key] = val;
    }
    return params;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string FormUrlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() && HexValue(s[i + 1]) >= 0 && HexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(HexValue(s[i + 1]) * 16 + HexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::string Multipart::MakeBoundary() {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, sizeof(kAlphabet) - 2);
    std::string b = "----egressFormBoundary";
    for (int i = 0; i < 24; ++i) b.push_back(kAlphabet[pick(rng)]);
    return b;
}

std::string Multipart::ContentType(const std::string& boundary) {
    return "multipart/form-data; boundary=" + boundary;
}

std::string Multipart::Encode(const FormData& form, const std::string& boundary) {
    std::string out;
    for (const auto& entry : form) {
        out += "--" + boundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + EscapeName(entry.name) + "\"";
        if (const auto* file = std::get_if<FileBlob>(&entry.value)) {
            out += "; filename=\"" + EscapeName(file->name) + "\"\r\n";
            out += "Content-Type: " +
                   (file->mimeType.empty() ? std::string("application/octet-stream") : file->mimeType) +
                   "\r\n\r\n";
            out.append(file->data.begin(), file->data.end());
        } else {
            out += "\r\n\r\n";
            out += std::get<std::string>(entry.value);
        }
        out += "\r\n";
    }
    out += "--" + boundary + "--\r\n";
    return out;
}

bool Multipart::ExtractBoundary(const std::string& contentType, std::string* boundary) {
    std::string head;
    const auto params = ParseParams(contentType, &head);
    auto it = params.find("boundary");
    if (it == params.end() || it->second.empty() || it->second.size() > 200) return false;
    if (boundary) *boundary = it->second;
    return true;
}

bool Multipart::Decode(const std::string& body, const std::string& boundary,
                       std::int64_t lastModified, FormData* out) {
    if (!out || boundary.empty()) return false;
    out->clear();

    const std::string delimiter = "--" + boundary;
    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) return false;
    pos += delimiter.size();

    while (true) {
        // Closing delimiter.
        if (body.compare(pos, 2, "--") == 0) return true;

        // Transport padding, then CRLF.
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) ++pos;
        if (body.compare(pos, 2, "\r\n") != 0) return false;
        pos += 2;

        const size_t headerEnd = body.find("\r\n\r\n", pos);
        if (headerEnd == std::string::npos) return false;
        const std::string headerBlock = body.substr(pos, headerEnd - pos);
        const size_t contentStart = headerEnd + 4;

        const size_t next = body.find("\r\n" + delimiter, contentStart);
        if (next == std::string::npos) return false;

        std::string disposition;
        std::string contentType;
        std::istringstream lines(headerBlock);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            const size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            const std::string key = ToLowerCopy(Trim(line.substr(0, colon)));
            const std::string val = Trim(line.substr(colon + 1));
            if (key == "content-disposition") disposition = val;
            else if (key == "content-type") contentType = val;
        }

        std::string kind;
        const auto params = ParseParams(disposition, &kind);
        auto nameIt = params.find("name");
        if (kind != "form-data" || nameIt == params.end()) return false;

        FormEntry entry;
        entry.name = UnescapeName(nameIt->second);
        auto fileIt = params.find("filename");
        if (fileIt != params.end()) {
            FileBlob blob;
            blob.name = UnescapeName(fileIt->second);
            if (!contentType.empty()) blob.mimeType = contentType;
            blob.lastModified = lastModified;
            blob.data.assign(body.begin() + static_cast<std::ptrdiff_t>(contentStart),
                             body.begin() + static_cast<std::ptrdiff_t>(next));
            entry.value = std::move(blob);
        } else {
            entry.value = body.substr(contentStart, next - contentStart);
        }
        out->push_back(std::move(entry));

        pos = next + 2 + delimiter.size();
    }
}

bool Multipart::DecodeUrlEncoded(const std::string& body, FormData* out) {
    if (!out) return false;
    out->clear();
    size_t start = 0;
    while (start <= body.size()) {
        size_t amp = body.find('&', start);
        if (amp == std::string::npos) amp = body.size();
        const std::string pair = body.substr(start, amp - start);
        if (!pair.empty()) {
            const size_t eq = pair.find('=');
            const std::string key = FormUrlDecode(eq == std::string::npos ? pair : pair.substr(0, eq));
            const std::string val = (eq == std::string::npos) ? std::string() : FormUrlDecode(pair.substr(eq + 1));
            out->push_back(FormEntry::Text(key, val));
        }
        start = amp + 1;
    }
    return true;
}

} // namespace fetch
} // namespace egress
