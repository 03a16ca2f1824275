#include <minhttp/net/response.h>
#include <minhttp/net/stream.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace minhttp::net;

namespace {

std::optional<Response> parse(const std::string& raw, Error& err, bool expects_body = true) {
    return Response::from_stream(std::make_unique<MemoryStream>(raw), err, expects_body);
}

std::string read_body(Response& resp) {
    std::string body;
    Error err;
    EXPECT_TRUE(resp.body_as_string(body, err)) << err.to_string();
    return body;
}

} // namespace

// ---------------------------------------------------------------------------
// Status classification
// ---------------------------------------------------------------------------
TEST(StatusClassTest, Bands) {
    EXPECT_EQ(classify_status(100), StatusClass::Informational);
    EXPECT_EQ(classify_status(199), StatusClass::Informational);
    EXPECT_EQ(classify_status(200), StatusClass::Success);
    EXPECT_EQ(classify_status(299), StatusClass::Success);
    EXPECT_EQ(classify_status(301), StatusClass::Redirect);
    EXPECT_EQ(classify_status(399), StatusClass::Redirect);
    EXPECT_EQ(classify_status(404), StatusClass::ClientError);
    EXPECT_EQ(classify_status(418), StatusClass::ClientError);
    EXPECT_EQ(classify_status(500), StatusClass::ServerError);
    EXPECT_EQ(classify_status(599), StatusClass::ServerError);
}

TEST(StatusClassTest, OutOfRangeCodesAreServerErrors) {
    EXPECT_EQ(classify_status(0), StatusClass::ServerError);
    EXPECT_EQ(classify_status(99), StatusClass::ServerError);
    EXPECT_EQ(classify_status(600), StatusClass::ServerError);
    EXPECT_EQ(classify_status(-1), StatusClass::ServerError);
}

TEST(StatusClassTest, Names) {
    EXPECT_STREQ(status_class_name(StatusClass::Informational), "Informational");
    EXPECT_STREQ(status_class_name(StatusClass::ClientError), "ClientError");
}

// ---------------------------------------------------------------------------
// Status line
// ---------------------------------------------------------------------------
TEST(ResponseTest, ParseSimpleResponse) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\n"
                      "Content-Type: text/html\r\n"
                      "Content-Length: 13\r\n"
                      "\r\n"
                      "<html></html>", err);
    ASSERT_TRUE(resp.has_value()) << err.to_string();
    EXPECT_EQ(resp->status(), 200);
    EXPECT_EQ(resp->reason(), "OK");
    EXPECT_TRUE(resp->is_success());
    EXPECT_EQ(resp->headers().get("Content-Type").value(), "text/html");
    EXPECT_EQ(read_body(*resp), "<html></html>");
}

TEST(ResponseTest, ReasonPhraseKeepsFirstWordOnly) {
    Error err;
    auto resp = parse("HTTP/1.1 404 Not Found\r\n\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), 404);
    EXPECT_EQ(resp->reason(), "Not");
    EXPECT_EQ(resp->status_class(), StatusClass::ClientError);
    EXPECT_FALSE(resp->is_success());
}

TEST(ResponseTest, EmptyStreamBecomesSynthetic503) {
    Error err;
    auto resp = parse("", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), 503);
    EXPECT_EQ(resp->reason(), "Server did not provide a status line");
    EXPECT_TRUE(resp->headers().empty());
    EXPECT_EQ(read_body(*resp), "");
}

TEST(ResponseTest, GarbledStatusCodeBecomesSynthetic503) {
    Error err;
    auto resp = parse("HTTP/1.1 abc OK\r\nX-A: 1\r\n\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), Response::kMissingStatusCode);
    EXPECT_EQ(resp->reason(), Response::kMissingStatusReason);
    // The header block is still parsed.
    EXPECT_EQ(resp->headers().get("X-A").value(), "1");
}

TEST(ResponseTest, StatusLineWithoutReasonBecomesSynthetic503) {
    Error err;
    auto resp = parse("HTTP/1.1 200\r\n\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), 503);
}

TEST(ResponseTest, NonStandardCodeIsKept) {
    Error err;
    auto resp = parse("HTTP/1.1 799 Odd\r\n\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), 799);
    EXPECT_EQ(resp->status_class(), StatusClass::ServerError);
}

// ---------------------------------------------------------------------------
// Header block
// ---------------------------------------------------------------------------
TEST(ResponseTest, HeaderValuesAreTrimmedAndCaseIsKept) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\n"
                      "X-Custom-Header:    padded value   \r\n"
                      "set-cookie: a=1\r\n"
                      "\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->headers().get("X-Custom-Header").value(), "padded value");
    EXPECT_TRUE(resp->headers().has("set-cookie"));
    EXPECT_FALSE(resp->headers().has("Set-Cookie"));
}

TEST(ResponseTest, ValueMayContainColons) {
    Error err;
    auto resp = parse("HTTP/1.1 302 Found\r\n"
                      "Location: http://example.com:8080/x\r\n"
                      "\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->headers().get("Location").value(), "http://example.com:8080/x");
}

TEST(ResponseTest, DuplicateHeaderLastWins) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\n"
                      "X-Dup: first\r\n"
                      "X-Dup: second\r\n"
                      "\r\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->headers().size(), 1u);
    EXPECT_EQ(resp->headers().get("X-Dup").value(), "second");
}

TEST(ResponseTest, HeaderLineWithoutColonIsMalformed) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\n"
                      "Content-Type: text/plain\r\n"
                      "this line has no separator\r\n"
                      "\r\n", err);
    EXPECT_FALSE(resp.has_value());
    EXPECT_EQ(err.kind, ErrorKind::MalformedResponse);
}

TEST(ResponseTest, BareLineFeedsAreAccepted) {
    Error err;
    auto resp = parse("HTTP/1.1 204 NoContent\nX-A: 1\n\n", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status(), 204);
    EXPECT_EQ(resp->headers().get("X-A").value(), "1");
}

TEST(ResponseTest, OverlongHeaderLineIsMalformed) {
    Error err;
    std::string raw = "HTTP/1.1 200 OK\r\nX-Big: " + std::string(200 * 1024, 'a') + "\r\n\r\n";
    auto resp = parse(raw, err);
    EXPECT_FALSE(resp.has_value());
    EXPECT_EQ(err.kind, ErrorKind::MalformedResponse);
}

TEST(ResponseTest, HeaderSetIsIndependentOfLineOrder) {
    Error err_a;
    Error err_b;
    auto a = parse("HTTP/1.1 200 OK\r\nA: 1\r\nB: 2\r\nC: 3\r\n\r\n", err_a);
    auto b = parse("HTTP/1.1 200 OK\r\nC: 3\r\nA: 1\r\nB: 2\r\n\r\n", err_b);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->headers() == b->headers());
}

// ---------------------------------------------------------------------------
// Body positioning
// ---------------------------------------------------------------------------
TEST(ResponseTest, ParsingStopsAtTheHeaderBlock) {
    const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHello";
    auto stream = std::make_unique<MemoryStream>(raw, 1);
    MemoryStream* view = stream.get();

    Error err;
    auto resp = Response::from_stream(std::move(stream), err);
    ASSERT_TRUE(resp.has_value());
    // One byte at a time: nothing past the blank line has been pulled.
    EXPECT_EQ(view->bytes_consumed(), raw.size() - 5);
    EXPECT_EQ(read_body(*resp), "Hello");
}

TEST(ResponseTest, ContentLengthBoundsTheBody) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabcdef", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(read_body(*resp), "abc");
}

TEST(ResponseTest, NoContentLengthReadsUntilClose) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\n\r\nuntil the end", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(read_body(*resp), "until the end");
}

TEST(ResponseTest, HeadResponseHasNoBody) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n", err, false);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(read_body(*resp), "");
}

TEST(ResponseTest, NotModifiedHasNoBody) {
    Error err;
    auto resp = parse("HTTP/1.1 304 NotModified\r\n\r\nleftover", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(read_body(*resp), "");
}

TEST(ResponseTest, BodyIsLeftEncodedUntilDecodeBody) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\nContent-Encoding: br\r\n\r\nxyz", err);
    ASSERT_TRUE(resp.has_value());
    EXPECT_TRUE(resp->decode_body());
    // Unknown encodings pass through untouched.
    EXPECT_EQ(resp->body().kind(), Decoder::Kind::Identity);
    EXPECT_EQ(resp->headers().get("Content-Encoding").value(), "br");
    EXPECT_EQ(read_body(*resp), "xyz");
}

TEST(ResponseTest, DecodeBodyRefusedAfterReading) {
    Error err;
    auto resp = parse("HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\n\r\nxyz", err);
    ASSERT_TRUE(resp.has_value());
    uint8_t byte = 0;
    ASSERT_TRUE(resp->body().read(&byte, 1, err).has_value());
    EXPECT_FALSE(resp->decode_body());
    EXPECT_EQ(resp->body().kind(), Decoder::Kind::Identity);
}

TEST(ResponseTest, DecodeBodyKeepsIdentityWithoutBody) {
    Error err;
    auto not_modified = parse("HTTP/1.1 304 NotModified\r\nContent-Encoding: gzip\r\n\r\n", err);
    ASSERT_TRUE(not_modified.has_value());
    EXPECT_FALSE(not_modified->decode_body());
    EXPECT_EQ(not_modified->body().kind(), Decoder::Kind::Identity);
    EXPECT_TRUE(not_modified->headers().has("Content-Encoding"));
    EXPECT_EQ(read_body(*not_modified), "");

    auto head_resp = parse("HTTP/1.1 200 OK\r\nContent-Encoding: deflate\r\nContent-Length: 40\r\n\r\n",
                      err, false);
    ASSERT_TRUE(head_resp.has_value());
    EXPECT_FALSE(head_resp->decode_body());
    EXPECT_EQ(head_resp->body().kind(), Decoder::Kind::Identity);
    EXPECT_EQ(read_body(*head_resp), "");
}
