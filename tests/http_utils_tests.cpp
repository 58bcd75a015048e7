#include "utilities/http.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(HttpUtils, RoundTripRequest) {
  HTTP::HTTPREQUEST req;
  req.method = HTTP::HttpMethod::POST;
  req.uri = "/codes/ABC123/upload-chunk?index=7";
  req.protocol = "HTTP/1.1";
  req.headers["Content-Type"] = "application/octet-stream";
  req.body = std::string("bin\0ary\r\n\r\ndata", 15);

  std::string raw = HTTP::GenerateHttpRequestString(req);
  auto parsed = HTTP::ParseHttpRequest(raw);
  EXPECT_EQ(parsed.method, req.method);
  EXPECT_EQ(parsed.uri, req.uri);
  EXPECT_EQ(parsed.path, "/codes/ABC123/upload-chunk");
  EXPECT_EQ(parsed.query.at("index"), "7");
  EXPECT_EQ(parsed.protocol, req.protocol);
  ASSERT_EQ(parsed.headers.at("Content-Type"), "application/octet-stream");
  EXPECT_EQ(HTTP::ContentLength(parsed.headers), 15u);
  EXPECT_EQ(parsed.body, req.body);
}

TEST(HttpUtils, HeadersAreCaseInsensitive) {
  auto parsed = HTTP::ParseHttpRequest("GET /health HTTP/1.1\r\n"
                                       "authorization: Bearer abc\r\n"
                                       "content-length: 0\r\n\r\n");
  EXPECT_EQ(HTTP::FindHeader(parsed.headers, "Authorization"), "Bearer abc");
  EXPECT_EQ(HTTP::FindHeader(parsed.headers, "X-Missing"), "");
  EXPECT_EQ(HTTP::ContentLength(parsed.headers), 0u);
}

TEST(HttpUtils, MalformedContentLengthThrows) {
  auto parsed = HTTP::ParseHttpRequest("POST /codes HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
  EXPECT_THROW(HTTP::ContentLength(parsed.headers), std::invalid_argument);
}

TEST(HttpUtils, QueryDecoding) {
  auto parsed = HTTP::ParseHttpRequest("GET /a%20b?name=hello+world&x=%2F&flag HTTP/1.1\r\n\r\n");
  EXPECT_EQ(parsed.path, "/a b");
  EXPECT_EQ(parsed.query.at("name"), "hello world");
  EXPECT_EQ(parsed.query.at("x"), "/");
  EXPECT_EQ(parsed.query.at("flag"), "");
  EXPECT_EQ(HTTP::UrlDecode(HTTP::UrlEncode("a/b c?d")), "a/b c?d");
  EXPECT_EQ(HTTP::UrlEncode("ABC-123_x.y~"), "ABC-123_x.y~");
}

TEST(HttpUtils, ResponseRoundTrip) {
  auto res = HTTP::MakeResponse(409, "application/json", "{\"duplicate\":true}");
  EXPECT_EQ(res.reasonPhrase, "Conflict");
  std::string raw = HTTP::GenerateResponseString(res) + "trailing garbage";
  auto parsed = HTTP::ParseHttpResponse(raw);
  EXPECT_EQ(parsed.statusCodeNumber, 409);
  EXPECT_EQ(parsed.reasonPhrase, "Conflict");
  EXPECT_EQ(parsed.contentType, "application/json");
  EXPECT_EQ(parsed.body, "{\"duplicate\":true}");
}

TEST(HttpUtils, MimeTypes) {
  EXPECT_EQ(HTTP::GetMimeType("report.PDF"), "application/pdf");
  EXPECT_EQ(HTTP::GetMimeType("notes.txt"), "text/plain");
  EXPECT_EQ(HTTP::GetMimeType("noextension"), "application/octet-stream");
  EXPECT_EQ(HTTP::StringToHttpMethod("PATCH"), HTTP::HttpMethod::PATCH);
  EXPECT_EQ(HTTP::HttpMethodToString(HTTP::StringToHttpMethod("BREW")), "INVALID");
}
