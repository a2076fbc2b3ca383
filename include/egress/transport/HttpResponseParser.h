#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace egress {
namespace transport {

// Incremental HTTP/1.x response parser for the client side.
// - Supports Content-Length, Transfer-Encoding: chunked and close-delimited bodies.
// - Skips interim 1xx responses.
// - Header names are lowercased; repeated headers are joined with ", ".
class HttpResponseParser {
public:
    enum ParseState { kExpectHeaders, kExpectBody, kGotAll, kError };

    // A HEAD response never carries a body.
    explicit HttpResponseParser(bool headRequest = false) : headRequest_(headRequest) {}

    // Returns true once the response is complete.
    bool feed(const char* data, size_t len);

    // The peer closed the connection. Completes a close-delimited body; any other
    // unfinished response becomes an error. Returns gotAll().
    bool FinishOnClose();

    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }
    const std::string& error() const { return error_; }

    // Stops with an error once the (encoded) body grows beyond `limit` bytes.
    // Without a call the body is unbounded.
    void setBodyLimit(size_t limit) { bodyLimit_ = limit; }
    bool bodyLimitExceeded() const { return bodyLimitExceeded_; }

    // Valid once the header block was parsed.
    bool headersComplete() const { return state_ == kExpectBody || state_ == kGotAll; }

    int statusCode() const { return statusCode_; }
    const std::string& reasonPhrase() const { return reason_; }
    const std::map<std::string, std::string>& headers() const { return headers_; }
    const std::string* header(const std::string& lowerName) const;

    bool hasContentLength() const { return hasContentLength_; }
    uint64_t contentLength() const { return contentLength_; }

    const std::string& body() const { return body_; }
    std::string TakeBody() { return std::move(body_); }

private:
    enum BodyMode { kNoBody, kLength, kChunked, kUntilClose };
    enum ChunkState { kChunkSize, kChunkData, kChunkCrlf, kTrailer };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;
    static constexpr size_t kMaxChunkLine = 1024;

    bool fail(const char* msg);
    bool parseHeaderBlock(const std::string& block);
    bool appendBody(const char* data, size_t len);
    // Returns true while progress can continue without more input.
    bool consumeBody();
    bool consumeChunked();

    bool headRequest_;
    ParseState state_{kExpectHeaders};
    std::string error_;
    std::string buf_;

    int statusCode_{0};
    std::string reason_;
    std::map<std::string, std::string> headers_;
    bool hasContentLength_{false};
    uint64_t contentLength_{0};

    BodyMode mode_{kNoBody};
    uint64_t remaining_{0};
    ChunkState chunkState_{kChunkSize};
    uint64_t chunkRemaining_{0};

    std::string body_;
    std::optional<size_t> bodyLimit_;
    bool bodyLimitExceeded_{false};
};

} // namespace transport
} // namespace egress
