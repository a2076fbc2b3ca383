#include "egress/transport/HttpResponseParser.h"

#include <cassert>
#include <string>

using egress::transport::HttpResponseParser;

// Feeds one byte at a time to exercise every split point.
static bool feedBytewise(HttpResponseParser& p, const std::string& data) {
    bool done = false;
    for (char c : data) done = p.feed(&c, 1);
    return done;
}

static void testContentLength() {
    const std::string resp =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "Content-Length: 5\r\n"
        "X-Multi: a\r\n"
        "x-multi: b\r\n"
        "\r\n"
        "hello";
    HttpResponseParser p;
    assert(feedBytewise(p, resp));
    assert(p.statusCode() == 200);
    assert(p.reasonPhrase() == "OK");
    assert(p.body() == "hello");
    assert(p.hasContentLength() && p.contentLength() == 5);
    assert(*p.header("content-type") == "text/plain");
    assert(*p.header("x-multi") == "a, b");
    assert(p.header("Content-Type") == nullptr);
}

static void testChunked() {
    const std::string resp =
        "HTTP/1.1 201 Created\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5;ext=1\r\nhello\r\n"
        "7\r\n, world\r\n"
        "0\r\n"
        "Trailer: x\r\n"
        "\r\n";
    HttpResponseParser whole;
    assert(whole.feed(resp.data(), resp.size()));
    assert(whole.body() == "hello, world");
    assert(!whole.hasContentLength());

    HttpResponseParser split;
    assert(feedBytewise(split, resp));
    assert(split.statusCode() == 201);
    assert(split.body() == "hello, world");
}

static void testUntilClose() {
    HttpResponseParser p;
    const std::string resp = "HTTP/1.0 200 OK\r\n\r\nstream";
    assert(!p.feed(resp.data(), resp.size()));
    assert(p.headersComplete());
    assert(p.FinishOnClose());
    assert(p.body() == "stream");
}

static void testTruncated() {
    HttpResponseParser p;
    const std::string resp = "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc";
    assert(!p.feed(resp.data(), resp.size()));
    assert(!p.FinishOnClose());
    assert(p.hasError());
}

static void testInterimAndBodyless() {
    HttpResponseParser p;
    const std::string resp =
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 204 No Content\r\nContent-Length: 99\r\n\r\n";
    assert(p.feed(resp.data(), resp.size()));
    assert(p.statusCode() == 204);
    assert(p.body().empty());

    HttpResponseParser head(true);
    const std::string headResp = "HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n";
    assert(head.feed(headResp.data(), headResp.size()));
    assert(head.contentLength() == 1000);
}

static void testBodyLimit() {
    HttpResponseParser p;
    p.setBodyLimit(4);
    const std::string resp = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n3\r\ndef\r\n0\r\n\r\n";
    assert(!p.feed(resp.data(), resp.size()));
    assert(p.hasError());
    assert(p.bodyLimitExceeded());

    // A zero limit is a limit: only an empty body fits.
    HttpResponseParser zero;
    zero.setBodyLimit(0);
    const std::string one = "HTTP/1.1 200 OK\r\nContent-Length: 1\r\n\r\nx";
    assert(!zero.feed(one.data(), one.size()));
    assert(zero.bodyLimitExceeded());

    HttpResponseParser empty;
    empty.setBodyLimit(0);
    const std::string none = "HTTP/1.1 204 No Content\r\n\r\n";
    assert(empty.feed(none.data(), none.size()));
    assert(!empty.hasError());
}

static void testMalformed() {
    const char* bad[] = {
        "HTTX/1.1 200 OK\r\n\r\n",
        "HTTP/1.1 2x0 OK\r\n\r\n",
        "HTTP/1.1 200 OK\r\nno colon here\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: -1\r\n\r\n",
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcXY",
    };
    for (const char* b : bad) {
        HttpResponseParser p;
        const std::string s = b;
        assert(!p.feed(s.data(), s.size()));
        assert(p.hasError());
        assert(!p.error().empty());
    }
}

int main() {
    testContentLength();
    testChunked();
    testUntilClose();
    testTruncated();
    testInterimAndBodyless();
    testBodyLimit();
    testMalformed();
    return 0;
}
