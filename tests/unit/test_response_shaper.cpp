#include "egress/fetch/ResponseShaper.h"
#include "egress/fetch/FetchError.h"
#include "egress/fetch/Multipart.h"

#include <cassert>
#include <chrono>

using egress::BodyType;
using egress::Bytes;
using egress::FetchError;
using egress::FileBlob;
using egress::FormData;
using egress::TransportResponse;
using egress::fetch::Multipart;
using egress::fetch::ResponseShaper;

static BodyType infer(const char* contentType) {
    const std::string ct = contentType ? contentType : "";
    return ResponseShaper::Negotiate(std::nullopt, contentType ? &ct : nullptr);
}

static void testNegotiation() {
    assert(infer(nullptr) == BodyType::kText);
    assert(infer("application/json") == BodyType::kJson);
    assert(infer("Application/JSON; charset=utf-8") == BodyType::kJson);
    assert(infer("multipart/form-data; boundary=x") == BodyType::kFormData);
    assert(infer("text") == BodyType::kText);
    assert(infer("text/html") == BodyType::kText);
    assert(infer("image/svg+xml") == BodyType::kText);
    assert(infer("application/atom+xml; charset=utf-8") == BodyType::kText);
    assert(infer("application/octet-stream") == BodyType::kArrayBuffer);
    assert(infer("image/png") == BodyType::kArrayBuffer);
    assert(infer("textual/thing") == BodyType::kArrayBuffer);
    assert(infer("") == BodyType::kArrayBuffer);

    const std::string png = "image/png";
    assert(ResponseShaper::Negotiate(BodyType::kText, &png) == BodyType::kText);
    assert(ResponseShaper::Negotiate(BodyType::kJson, nullptr) == BodyType::kJson);
}

static TransportResponse response(const std::string& contentType, const std::string& body) {
    TransportResponse r;
    r.status = 200;
    if (!contentType.empty()) r.headers["content-type"] = contentType;
    r.body = body;
    return r;
}

static FetchError::Kind shapeFailure(BodyType type, const TransportResponse& r) {
    try {
        ResponseShaper::Shape(type, r);
    } catch (const FetchError& e) {
        return e.kind();
    }
    assert(false && "Shape should have failed");
    return FetchError::Kind::kTransportFailure;
}

static void testTextAndBinary() {
    const auto r = response("text/plain", std::string("a\0b", 3));
    const auto text = ResponseShaper::Shape(BodyType::kText, r);
    assert(std::get<std::string>(text).size() == 3);
    const auto bin = ResponseShaper::Shape(BodyType::kArrayBuffer, r);
    assert((std::get<Bytes>(bin) == Bytes{'a', 0, 'b'}));
}

static void testJson() {
    const auto ok = ResponseShaper::Shape(BodyType::kJson, response("application/json", "{\"test\":\"json\",\"n\":[1,2]}"));
    const Json::Value& v = std::get<Json::Value>(ok);
    assert(v["test"].asString() == "json");
    assert(v["n"].size() == 2);

    assert(shapeFailure(BodyType::kJson, response("application/json", "{bad")) == FetchError::Kind::kResponseFormat);
    assert(shapeFailure(BodyType::kJson, response("application/json", "")) == FetchError::Kind::kResponseFormat);
}

static void testFormData() {
    FormData form;
    form.push_back(egress::FormEntry::Text("k", "v"));
    form.push_back(egress::FormEntry::Binary("f", Bytes{1, 2, 3}, "x.bin"));
    const std::string boundary = Multipart::MakeBoundary();

    const auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const auto shaped = ResponseShaper::Shape(
        BodyType::kFormData, response(Multipart::ContentType(boundary), Multipart::Encode(form, boundary)));
    const FormData& out = std::get<FormData>(shaped);
    assert(out.size() == 2);
    assert(std::get<std::string>(out[0].value) == "v");
    const FileBlob& f = std::get<FileBlob>(out[1].value);
    assert(f.name == "x.bin");
    assert(f.size() == 3);
    assert(f.lastModified >= before);

    const auto urlencoded = ResponseShaper::Shape(BodyType::kFormData,
                                                  response("application/x-www-form-urlencoded", "a=1&b=2"));
    assert(std::get<FormData>(urlencoded).size() == 2);

    assert(shapeFailure(BodyType::kFormData, response("text/plain", "a=1")) == FetchError::Kind::kResponseFormat);
    assert(shapeFailure(BodyType::kFormData, response("multipart/form-data", "--x--")) == FetchError::Kind::kResponseFormat);
    assert(shapeFailure(BodyType::kFormData, response("multipart/form-data; boundary=x", "garbage")) ==
           FetchError::Kind::kResponseFormat);
}

int main() {
    testNegotiation();
    testTextAndBinary();
    testJson();
    testFormData();
    return 0;
}
