#include "tern/request-parser.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>

#include "tern/error-kind.hpp"
#include "tern/http-constants.hpp"
#include "tern/http-method.hpp"
#include "tern/http-request.hpp"

namespace tern {

namespace {

// Helper to build a raw HTTP request head with a Host header.
std::string BuildHead(std::string_view method, std::string_view target, std::string_view version = "HTTP/1.1",
                      std::string_view extraHeaders = "") {
  std::string str;
  str.append(method);
  str.push_back(' ');
  str.append(target);
  str.push_back(' ');
  str.append(version);
  str.append(http::CRLF);
  str.append("Host: h");
  str.append(http::CRLF);
  str.append(extraHeaders);
  str.append(http::CRLF);
  return str;
}

// Head of exactly totalSize bytes, padded with a single X-Pad header.
std::string BuildHeadOfSize(std::size_t totalSize) {
  std::string head = BuildHead("GET", "/", "HTTP/1.1", "X-Pad: \r\n");
  const std::size_t padPos = head.find("X-Pad: ") + 7;
  head.insert(padPos, totalSize - head.size(), 'a');
  return head;
}

}  // namespace

class RequestParserTest : public ::testing::Test {
 protected:
  http::ErrorKind parse(std::string_view head) { return parser.parseHead(head, req); }

  RequestParser parser;
  HttpRequest req;
};

TEST_F(RequestParserTest, ParsesSimpleGet) {
  ASSERT_EQ(parse("GET /hello?x=1&y=%20 HTTP/1.1\r\nHost: example.com\r\nAccept:  text/plain \r\n\r\n"),
            http::ErrorKind::None);
  EXPECT_EQ(req.method(), http::Method::GET);
  EXPECT_EQ(req.methodStr(), "GET");
  EXPECT_EQ(req.target(), "/hello?x=1&y=%20");
  EXPECT_EQ(req.path(), "/hello");
  EXPECT_EQ(req.query(), "x=1&y=%20");
  EXPECT_EQ(req.decodedPath(), "/hello");
  EXPECT_EQ(req.headerValueOrEmpty("host"), "example.com");
  EXPECT_EQ(req.headerValueOrEmpty("ACCEPT"), "text/plain");
  EXPECT_FALSE(req.headerValue("X-Missing"));
  EXPECT_TRUE(req.keepAlive());
  EXPECT_EQ(req.contentLength(), 0U);
}

TEST_F(RequestParserTest, HeadersKeepArrivalOrderAndCase) {
  ASSERT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-Dup: a\r\nx-other: b\r\nX-DUP: c\r\n")), http::ErrorKind::None);
  ASSERT_EQ(req.headers().size(), 4U);
  EXPECT_EQ(req.headers()[0].name, "Host");
  EXPECT_EQ(req.headers()[1].name, "X-Dup");
  EXPECT_EQ(req.headers()[2].name, "x-other");
  EXPECT_EQ(req.headers()[3].name, "X-DUP");
  const auto values = req.headerValues("x-dup");
  ASSERT_EQ(values.size(), 2U);
  EXPECT_EQ(values[0], "a");
  EXPECT_EQ(values[1], "c");
}

TEST_F(RequestParserTest, PathIsPercentDecodedButRawFormIsKept) {
  ASSERT_EQ(parse(BuildHead("GET", "/a%2Cb/c+d")), http::ErrorKind::None);
  EXPECT_EQ(req.path(), "/a%2Cb/c+d");
  EXPECT_EQ(req.decodedPath(), "/a,b/c+d");
}

TEST_F(RequestParserTest, InvalidPercentEncodingInPathIsMalformed) {
  EXPECT_EQ(parse(BuildHead("GET", "/a%2")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/a%zz")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, QueryIsNotValidated) {
  ASSERT_EQ(parse(BuildHead("GET", "/p?%zz")), http::ErrorKind::None);
  EXPECT_EQ(req.query(), "%zz");
}

TEST_F(RequestParserTest, AllKnownMethods) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    ASSERT_EQ(parse(BuildHead(http::MethodToStr(method), "/")), http::ErrorKind::None);
    EXPECT_EQ(req.method(), method);
  }
}

TEST_F(RequestParserTest, UnknownMethodIsReportedAfterFullParse) {
  ASSERT_EQ(parse(BuildHead("BREW", "/pot", "HTTP/1.1", "Content-Length: 3\r\n")), http::ErrorKind::UnknownMethod);
  EXPECT_EQ(req.methodStr(), "BREW");
  EXPECT_EQ(req.contentLength(), 3U);
  EXPECT_TRUE(req.keepAlive());
}

TEST_F(RequestParserTest, MethodIsCaseSensitive) {
  EXPECT_EQ(parse(BuildHead("get", "/")), http::ErrorKind::UnknownMethod);
}

TEST_F(RequestParserTest, MalformedRequestLines) {
  EXPECT_EQ(parse("INVALID\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET  / HTTP/1.1\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET /  HTTP/1.1\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTP/1.1 \r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET\t/ HTTP/1.1\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTX/1.1\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTP/11\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GE@T / HTTP/1.1\r\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, UnsupportedVersions) {
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.0")), http::ErrorKind::UnsupportedVersion);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/2.0")), http::ErrorKind::UnsupportedVersion);
}

TEST_F(RequestParserTest, TargetForms) {
  EXPECT_EQ(parse(BuildHead("GET", "http://example.com/")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "example.com:443")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "*")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("OPTIONS", "http://example.com/")), http::ErrorKind::Malformed);
  ASSERT_EQ(parse(BuildHead("OPTIONS", "*")), http::ErrorKind::None);
  EXPECT_EQ(req.path(), "*");
  EXPECT_EQ(req.method(), http::Method::OPTIONS);
}

TEST_F(RequestParserTest, TargetWithControlCharIsMalformed) {
  EXPECT_EQ(parse(BuildHead("GET", std::string("/a\x01") + "b")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", std::string("/a\x7F") + "b")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, PathAndQueryLengthCaps) {
  const std::string maxPath = "/" + std::string(8UL * 1024UL - 1UL, 'p');
  EXPECT_EQ(parse(BuildHead("GET", maxPath)), http::ErrorKind::None);
  EXPECT_EQ(parse(BuildHead("GET", maxPath + "p")), http::ErrorKind::UriTooLong);

  const std::string maxQuery(8UL * 1024UL, 'q');
  EXPECT_EQ(parse(BuildHead("GET", "/?" + maxQuery)), http::ErrorKind::None);
  EXPECT_EQ(parse(BuildHead("GET", "/?" + maxQuery + "q")), http::ErrorKind::UriTooLong);
}

TEST_F(RequestParserTest, BareLineEndingsAreMalformed) {
  EXPECT_EQ(parse("GET / HTTP/1.1\nHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTP/1.1\rHost: h\r\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHost: h\n\r\n"), http::ErrorKind::Malformed);
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nHo\rst: h\r\n\r\n"), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, ObsoleteLineFoldingIsMalformed) {
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-A: a\r\n b\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-A: a\r\n\tb\r\n")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, HeaderNameGrammar) {
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-A : a\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", ": a\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "NoColon\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X(A): a\r\n")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, HeaderValueGrammar) {
  ASSERT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-Tab:\ta\tb \t\r\nX-Empty:\r\n")), http::ErrorKind::None);
  EXPECT_EQ(req.headerValueOrEmpty("X-Tab"), "a\tb");
  ASSERT_TRUE(req.headerValue("X-Empty"));
  EXPECT_TRUE(req.headerValue("X-Empty")->empty());

  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", std::string("X-Bin: a\x01") + "\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "X-Utf8: \xC3\xA9\r\n")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, HundredHeadersAcceptedHundredAndOneRejected) {
  std::string extra;
  // Host is the first of the 100 headers
  for (int headerPos = 0; headerPos < 99; ++headerPos) {
    extra.append("X-H" + std::to_string(headerPos) + ": v\r\n");
  }
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", extra)), http::ErrorKind::None);
  EXPECT_EQ(req.headers().size(), 100U);
  extra.append("X-Last: v\r\n");
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", extra)), http::ErrorKind::HeadTooLarge);
}

TEST_F(RequestParserTest, ContentLength) {
  ASSERT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: 42\r\n")), http::ErrorKind::None);
  EXPECT_EQ(req.contentLength(), 42U);

  ASSERT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: 5\r\ncontent-length: 5\r\n")),
            http::ErrorKind::None);
  EXPECT_EQ(req.contentLength(), 5U);

  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: 5\r\nContent-Length: 6\r\n")),
            http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: -1\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: +1\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: 1 2\r\n")), http::ErrorKind::Malformed);
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length:\r\n")), http::ErrorKind::Malformed);

  // Well formed but too large for size_t: saturated, the body cap rejects it later.
  ASSERT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Content-Length: 99999999999999999999999\r\n")),
            http::ErrorKind::None);
  EXPECT_EQ(req.contentLength(), std::numeric_limits<std::size_t>::max());
}

TEST_F(RequestParserTest, AnyTransferEncodingIsUnsupported) {
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "Transfer-Encoding: chunked\r\n")),
            http::ErrorKind::TransferEncodingUnsupported);
  EXPECT_EQ(parse(BuildHead("POST", "/", "HTTP/1.1", "transfer-encoding: identity\r\nContent-Length: 2\r\n")),
            http::ErrorKind::TransferEncodingUnsupported);
}

TEST_F(RequestParserTest, HostRules) {
  EXPECT_EQ(parse("GET / HTTP/1.1\r\n\r\n"), http::ErrorKind::MissingHost);
  EXPECT_EQ(parse("GET / HTTP/1.1\r\nAccept: */*\r\n\r\n"), http::ErrorKind::MissingHost);
  EXPECT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "host: other\r\n")), http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, ConnectionClose) {
  ASSERT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "Connection: Close\r\n")), http::ErrorKind::None);
  EXPECT_FALSE(req.keepAlive());
  ASSERT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "Connection: keep-alive, close\r\n")), http::ErrorKind::None);
  EXPECT_FALSE(req.keepAlive());
  ASSERT_EQ(parse(BuildHead("GET", "/", "HTTP/1.1", "Connection: keep-alive\r\n")), http::ErrorKind::None);
  EXPECT_TRUE(req.keepAlive());
}

TEST_F(RequestParserTest, ErrorPrecedence) {
  // Request line problems win over header problems.
  EXPECT_EQ(parse("GET / HTTP/1.0\r\nTransfer-Encoding: chunked\r\n\r\n"), http::ErrorKind::UnsupportedVersion);
  // Transfer-Encoding is reported before a missing Host.
  EXPECT_EQ(parse("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"),
            http::ErrorKind::TransferEncodingUnsupported);
  // An unknown method is only reported for an otherwise valid head.
  EXPECT_EQ(parse("BREW / HTTP/1.1\r\n\r\n"), http::ErrorKind::MissingHost);
}

TEST_F(RequestParserTest, RequestOwnsItsHead) {
  std::string head = BuildHead("GET", "/owned", "HTTP/1.1", "X-A: value\r\n");
  ASSERT_EQ(parse(head), http::ErrorKind::None);
  head.assign(head.size(), 'Z');
  EXPECT_EQ(req.path(), "/owned");
  EXPECT_EQ(req.headerValueOrEmpty("X-A"), "value");
}

TEST_F(RequestParserTest, ParserReuseClearsPreviousRequest) {
  ASSERT_EQ(parse(BuildHead("POST", "/first", "HTTP/1.1", "Content-Length: 3\r\nConnection: close\r\n")),
            http::ErrorKind::None);
  ASSERT_EQ(parse(BuildHead("GET", "/second")), http::ErrorKind::None);
  EXPECT_EQ(req.contentLength(), 0U);
  EXPECT_TRUE(req.keepAlive());
  EXPECT_EQ(req.headers().size(), 1U);
}

// ---------------------------------------------------------------------------
// scanHead
// ---------------------------------------------------------------------------

TEST_F(RequestParserTest, ScanHeadNeedsMoreUntilDoubleCrlf) {
  const std::string head = BuildHead("GET", "/");
  for (std::size_t len = 0; len < head.size(); ++len) {
    const HeadScan scan = parser.scanHead(std::string_view(head).substr(0, len));
    EXPECT_EQ(scan.status, HeadScan::Status::NeedMore) << len;
  }
  const HeadScan scan = parser.scanHead(head + "BODY");
  ASSERT_EQ(scan.status, HeadScan::Status::Complete);
  EXPECT_EQ(scan.headLength, head.size());
}

TEST_F(RequestParserTest, ScanHeadIncremental) {
  const std::string head = BuildHead("GET", "/incremental");
  std::size_t scanned = 0;
  for (std::size_t len = 1; len <= head.size(); ++len) {
    const HeadScan scan = parser.scanHead(std::string_view(head).substr(0, len), scanned);
    scanned = len;
    if (len < head.size()) {
      ASSERT_EQ(scan.status, HeadScan::Status::NeedMore);
    } else {
      ASSERT_EQ(scan.status, HeadScan::Status::Complete);
      EXPECT_EQ(scan.headLength, head.size());
    }
  }
}

TEST_F(RequestParserTest, ScanHeadRejectsLeadingEmptyLines) {
  EXPECT_EQ(parser.scanHead("\r\nGET / HTTP/1.1\r\nHost: h\r\n\r\n").error, http::ErrorKind::Malformed);
  EXPECT_EQ(parser.scanHead("\nGET / HTTP/1.1\r\n").error, http::ErrorKind::Malformed);
}

TEST_F(RequestParserTest, ScanHeadRejectsBareLineEndingsEarly) {
  EXPECT_EQ(parser.scanHead("GET / HTTP/1.1\nHost").error, http::ErrorKind::Malformed);
  EXPECT_EQ(parser.scanHead("GET / HTTP/1.1\rHost").error, http::ErrorKind::Malformed);
  // A trailing CR alone is not conclusive yet.
  EXPECT_EQ(parser.scanHead("GET / HTTP/1.1\r").status, HeadScan::Status::NeedMore);
}

TEST_F(RequestParserTest, HeadOfExactlyMaxSizeIsAccepted) {
  const std::string head = BuildHeadOfSize(32UL * 1024UL);
  ASSERT_EQ(head.size(), 32UL * 1024UL);
  const HeadScan scan = parser.scanHead(head);
  ASSERT_EQ(scan.status, HeadScan::Status::Complete);
  EXPECT_EQ(scan.headLength, head.size());
  EXPECT_EQ(parse(head), http::ErrorKind::None);
}

TEST_F(RequestParserTest, HeadOneByteOverMaxSizeIsTooLarge) {
  const std::string head = BuildHeadOfSize((32UL * 1024UL) + 1UL);
  const HeadScan scan = parser.scanHead(head);
  EXPECT_EQ(scan.status, HeadScan::Status::Error);
  EXPECT_EQ(scan.error, http::ErrorKind::HeadTooLarge);
  // Not enough bytes received yet to conclude.
  EXPECT_EQ(parser.scanHead(std::string_view(head).substr(0, 32UL * 1024UL - 1UL)).status,
            HeadScan::Status::NeedMore);
}

TEST_F(RequestParserTest, CustomLimits) {
  RequestParser small(ParserLimits{.maxHeaderBytes = 64, .maxHeaderCount = 2, .maxPathBytes = 4, .maxQueryBytes = 2});
  HttpRequest request;
  EXPECT_EQ(small.parseHead(BuildHead("GET", "/abcd"), request), http::ErrorKind::UriTooLong);
  EXPECT_EQ(small.parseHead(BuildHead("GET", "/abc?xyz"), request), http::ErrorKind::UriTooLong);
  EXPECT_EQ(small.parseHead(BuildHead("GET", "/abc", "HTTP/1.1", "A: 1\r\nB: 2\r\n"), request),
            http::ErrorKind::HeadTooLarge);
  EXPECT_EQ(small.scanHead(std::string(64, 'a')).error, http::ErrorKind::HeadTooLarge);
}

}  // namespace tern
