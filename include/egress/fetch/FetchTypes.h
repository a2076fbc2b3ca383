#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "egress/fetch/CancellationToken.h"

namespace egress {

using Bytes = std::vector<std::uint8_t>;
using HeaderMap = std::map<std::string, std::string>;

// Case-insensitive header helpers; HeaderMap keeps whatever case was inserted.
const std::string* FindHeader(const HeaderMap& headers, const std::string& name);
void SetHeader(HeaderMap* headers, const std::string& name, const std::string& value);

// A file-like form value.
struct FileBlob {
    std::string name;
    std::string mimeType{"application/octet-stream"};
    std::int64_t lastModified{0}; // ms since epoch
    Bytes data;

    std::size_t size() const { return data.size(); }
};

struct FormEntry {
    std::string name;
    std::variant<std::string, FileBlob> value;

    static FormEntry Text(std::string name, std::string value);
    static FormEntry File(std::string name, FileBlob file);
    // Raw bytes sent as a file part; an empty filename becomes "blob".
    static FormEntry Binary(std::string name, Bytes data, std::string filename = std::string());

    bool isFile() const { return std::holds_alternative<FileBlob>(value); }
};

using FormData = std::vector<FormEntry>;

enum class BodyType { kText, kJson, kArrayBuffer, kFormData };

const char* BodyTypeName(BodyType type);
bool ParseBodyType(const std::string& name, BodyType* out);

using RequestBody = std::variant<std::monostate, std::string, Bytes, FormData>;
using ResponseBody = std::variant<std::monostate, std::string, Bytes, Json::Value, FormData>;

struct FetchParams {
    std::optional<BodyType> type;
    std::string method;           // empty means GET
    HeaderMap headers;
    RequestBody body;
    std::string redirect;         // follow | error | manual
    std::string credentials;
    std::string mode;
    std::string referrer;
    std::string referrerPolicy;
    std::optional<std::chrono::milliseconds> timeout;
};

struct FetchResult {
    std::string url;
    bool ok{false};
    std::string type;
    std::string statusText;
    bool redirected{false};
    int status{0};
    HeaderMap headers;
    BodyType bodyType{BodyType::kText};
    ResponseBody body;
};

// What the executor hands to the transport after validation.
struct TransportRequest {
    std::string url;
    std::string scheme;
    std::string host;
    std::uint16_t port{0};
    std::string target;           // path + query
    std::vector<std::string> addresses; // validated addresses for `host`
    std::string method;
    HeaderMap headers;
    std::string body;
    std::string redirect;
    std::string credentials;
    std::string mode;
    std::string referrer;
    std::string referrerPolicy;
    std::optional<std::uint64_t> maxContentLength;
};

struct TransportResponse {
    std::string url;
    int status{0};
    std::string statusText;
    bool redirected{false};
    std::string type{"basic"};
    HeaderMap headers;
    std::string body;
};

// Performs the network exchange. Throws on failure; expected to observe `token`.
using Transport = std::function<TransportResponse(const TransportRequest&, const fetch::CancellationTokenPtr& token)>;

} // namespace egress
