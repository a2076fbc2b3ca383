#include "egress/transport/HttpResponseParser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace egress {
namespace transport {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static std::string TrimWs(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    size_t j = s.size();
    while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t')) --j;
    return s.substr(i, j - i);
}

static bool ParseDecimal(const std::string& s, uint64_t* out) {
    if (s.empty() || s.size() > 19) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    *out = v;
    return true;
}

const std::string* HttpResponseParser::header(const std::string& lowerName) const {
    auto it = headers_.find(lowerName);
    return it == headers_.end() ? nullptr : &it->second;
}

bool HttpResponseParser::fail(const char* msg) {
    state_ = kError;
    error_ = msg;
    return false;
}

bool HttpResponseParser::parseHeaderBlock(const std::string& block) {
    headers_.clear();
    hasContentLength_ = false;
    contentLength_ = 0;

    size_t lineEnd = block.find("\r\n");
    const std::string statusLine = block.substr(0, lineEnd);

    // HTTP/1.1 200 OK
    if (statusLine.compare(0, 5, "HTTP/") != 0) return fail("malformed status line");
    const size_t sp1 = statusLine.find(' ');
    if (sp1 == std::string::npos) return fail("malformed status line");
    const size_t sp2 = statusLine.find(' ', sp1 + 1);
    const std::string code = statusLine.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    uint64_t status = 0;
    if (code.size() != 3 || !ParseDecimal(code, &status) || status < 100) return fail("malformed status code");
    statusCode_ = static_cast<int>(status);
    reason_ = (sp2 == std::string::npos) ? std::string() : TrimWs(statusLine.substr(sp2 + 1));

    size_t pos = (lineEnd == std::string::npos) ? block.size() : lineEnd + 2;
    while (pos < block.size()) {
        size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        const std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) continue;
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) return fail("malformed header line");
        const std::string key = ToLowerCopy(TrimWs(line.substr(0, colon)));
        const std::string val = TrimWs(line.substr(colon + 1));
        auto it = headers_.find(key);
        if (it == headers_.end()) {
            headers_.emplace(key, val);
        } else {
            it->second += ", " + val;
        }
    }

    // Interim response: the real one follows on the same connection.
    if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
        headers_.clear();
        reason_.clear();
        statusCode_ = 0;
        state_ = kExpectHeaders;
        return true;
    }

    const std::string* te = header("transfer-encoding");
    const std::string* cl = header("content-length");
    if (cl) {
        uint64_t n = 0;
        // Folded duplicates ("10, 10") are accepted when they agree.
        std::string first = *cl;
        const size_t comma = first.find(',');
        if (comma != std::string::npos) {
            first = TrimWs(first.substr(0, comma));
        }
        if (ParseDecimal(first, &n)) {
            hasContentLength_ = true;
            contentLength_ = n;
        }
    }

    if (headRequest_ || statusCode_ == 204 || statusCode_ == 304) {
        mode_ = kNoBody;
    } else if (te && ToLowerCopy(*te).find("chunked") != std::string::npos) {
        mode_ = kChunked;
        chunkState_ = kChunkSize;
        chunkRemaining_ = 0;
    } else if (cl) {
        if (!hasContentLength_) return fail("invalid content-length");
        mode_ = kLength;
        remaining_ = contentLength_;
    } else {
        mode_ = kUntilClose;
    }

    state_ = (mode_ == kNoBody || (mode_ == kLength && remaining_ == 0)) ? kGotAll : kExpectBody;
    return true;
}

bool HttpResponseParser::appendBody(const char* data, size_t len) {
    if (bodyLimit_ && body_.size() + len > *bodyLimit_) {
        bodyLimitExceeded_ = true;
        return fail("response body exceeds limit");
    }
    body_.append(data, len);
    return true;
}

bool HttpResponseParser::consumeChunked() {
    switch (chunkState_) {
        case kChunkSize: {
            const size_t eol = buf_.find("\r\n");
            if (eol == std::string::npos) {
                if (buf_.size() > kMaxChunkLine) return fail("chunk size line too long");
                return false;
            }
            std::string line = buf_.substr(0, eol);
            buf_.erase(0, eol + 2);
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = TrimWs(line);
            if (line.empty() || line.size() > 16) return fail("invalid chunk size");
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (endp != line.c_str() + line.size()) return fail("invalid chunk size");
            chunkRemaining_ = n;
            chunkState_ = (n == 0) ? kTrailer : kChunkData;
            return true;
        }
        case kChunkData: {
            if (buf_.empty()) return false;
            const size_t take = static_cast<size_t>(std::min<uint64_t>(chunkRemaining_, buf_.size()));
            if (!appendBody(buf_.data(), take)) return false;
            buf_.erase(0, take);
            chunkRemaining_ -= take;
            if (chunkRemaining_ == 0) chunkState_ = kChunkCrlf;
            return true;
        }
        case kChunkCrlf:
            if (buf_.size() < 2) return false;
            if (buf_[0] != '\r' || buf_[1] != '\n') return fail("missing CRLF after chunk");
            buf_.erase(0, 2);
            chunkState_ = kChunkSize;
            return true;
        case kTrailer: {
            if (buf_.size() >= 2 && buf_[0] == '\r' && buf_[1] == '\n') {
                buf_.erase(0, 2);
                state_ = kGotAll;
                return false;
            }
            const size_t end = buf_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (buf_.size() > kMaxHeaderBytes) return fail("trailer too large");
                return false;
            }
            buf_.erase(0, end + 4);
            state_ = kGotAll;
            return false;
        }
    }
    return false;
}

bool HttpResponseParser::consumeBody() {
    switch (mode_) {
        case kNoBody:
            state_ = kGotAll;
            return false;
        case kLength: {
            const size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, buf_.size()));
            if (take > 0 && !appendBody(buf_.data(), take)) return false;
            buf_.erase(0, take);
            remaining_ -= take;
            if (remaining_ == 0) state_ = kGotAll;
            return false;
        }
        case kUntilClose:
            if (!buf_.empty() && !appendBody(buf_.data(), buf_.size())) return false;
            buf_.clear();
            return false;
        case kChunked:
            return consumeChunked();
    }
    return false;
}

bool HttpResponseParser::feed(const char* data, size_t len) {
    if (state_ == kError) return false;
    if (state_ == kGotAll) return true;
    if (data && len > 0) buf_.append(data, len);

    while (state_ == kExpectHeaders || state_ == kExpectBody) {
        if (state_ == kExpectHeaders) {
            const size_t end = buf_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (buf_.size() > kMaxHeaderBytes) fail("response header block too large");
                break;
            }
            const std::string block = buf_.substr(0, end + 2);
            buf_.erase(0, end + 4);
            if (!parseHeaderBlock(block)) break;
            continue;
        }
        if (!consumeBody()) break;
    }
    return state_ == kGotAll;
}

bool HttpResponseParser::FinishOnClose() {
    if (state_ == kGotAll) return true;
    if (state_ == kExpectBody && mode_ == kUntilClose) {
        state_ = kGotAll;
        return true;
    }
    if (state_ != kError) fail("connection closed before response completed");
    return false;
}

} // namespace transport
} // namespace egress
