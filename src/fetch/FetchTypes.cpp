#include "egress/fetch/FetchTypes.h"

#include <chrono>

namespace egress {

static bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = a[i];
        char cb = b[i];
        if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
        if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
        if (ca != cb) return false;
    }
    return true;
}

const std::string* FindHeader(const HeaderMap& headers, const std::string& name) {
    auto exact = headers.find(name);
    if (exact != headers.end()) return &exact->second;
    for (const auto& kv : headers) {
        if (IEquals(kv.first, name)) return &kv.second;
    }
    return nullptr;
}

void SetHeader(HeaderMap* headers, const std::string& name, const std::string& value) {
    for (auto it = headers->begin(); it != headers->end();) {
        if (IEquals(it->first, name)) {
            it = headers->erase(it);
            continue;
        }
        ++it;
    }
    (*headers)[name] = value;
}

FormEntry FormEntry::Text(std::string name, std::string value) {
    FormEntry e;
    e.name = std::move(name);
    e.value = std::move(value);
    return e;
}

FormEntry FormEntry::File(std::string name, FileBlob file) {
    FormEntry e;
    e.name = std::move(name);
    e.value = std::move(file);
    return e;
}

FormEntry FormEntry::Binary(std::string name, Bytes data, std::string filename) {
    FileBlob blob;
    blob.name = filename.empty() ? std::string("blob") : std::move(filename);
    blob.data = std::move(data);
    blob.lastModified = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    return File(std::move(name), std::move(blob));
}

const char* BodyTypeName(BodyType type) {
    switch (type) {
        case BodyType::kText: return "text";
        case BodyType::kJson: return "json";
        case BodyType::kArrayBuffer: return "arrayBuffer";
        case BodyType::kFormData: return "formData";
    }
    return "text";
}

bool ParseBodyType(const std::string& name, BodyType* out) {
    if (name == "text") *out = BodyType::kText;
    else if (name == "json") *out = BodyType::kJson;
    else if (name == "arrayBuffer") *out = BodyType::kArrayBuffer;
    else if (name == "formData") *out = BodyType::kFormData;
    else return false;
    return true;
}

} // namespace egress
