#include "tern/wire-reader.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "tern/base-fd.hpp"
#include "tern/error-kind.hpp"
#include "tern/http-method.hpp"
#include "tern/http-request.hpp"
#include "tern/request-parser.hpp"
#include "tern/socket-ops.hpp"

namespace tern {

class WireReaderTest : public ::testing::Test {
 protected:
  static constexpr std::size_t kMaxBodyBytes = 64;

  void SetUp() override {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);
    serverSide = BaseFd(fds[0]);
    clientSide = BaseFd(fds[1]);
  }

  void clientSend(std::string_view data) const {
    ASSERT_EQ(SafeSend(clientSide.fd(), data), static_cast<int64_t>(data.size()));
  }

  BaseFd serverSide;
  BaseFd clientSide;
  WireReader reader{ParserLimits{}, kMaxBodyBytes};
  HttpRequest request;
};

TEST_F(WireReaderTest, WouldBlockWhenNothingToRead) {
  const FillResult result = reader.fill(serverSide.fd());
  EXPECT_EQ(result.status, IoStatus::WouldBlock);
  EXPECT_EQ(result.nbBytes, 0U);
}

TEST_F(WireReaderTest, PeerClosedOnEof) {
  clientSide.close();
  EXPECT_EQ(reader.fill(serverSide.fd()).status, IoStatus::PeerClosed);
}

TEST_F(WireReaderTest, RequestSplitAcrossReads) {
  clientSend("GET /hel");
  auto fillResult = reader.fill(serverSide.fd());
  EXPECT_EQ(fillResult.status, IoStatus::Ok);
  EXPECT_EQ(fillResult.nbBytes, 8U);
  EXPECT_EQ(reader.next(request).status, FrameResult::Status::NeedMore);

  clientSend("lo HTTP/1.1\r\nHost: x\r");
  reader.fill(serverSide.fd());
  EXPECT_EQ(reader.next(request).status, FrameResult::Status::NeedMore);

  clientSend("\n\r\n");
  reader.fill(serverSide.fd());
  ASSERT_EQ(reader.next(request).status, FrameResult::Status::Complete);
  EXPECT_EQ(request.method(), http::Method::GET);
  EXPECT_EQ(request.path(), "/hello");
  EXPECT_EQ(reader.bufferedBytes(), 0U);
}

TEST_F(WireReaderTest, BodyReadByContentLength) {
  clientSend("POST /echo HTTP/1.1\r\nHost: x\r\nContent-Length: 10\r\n\r\n0123");
  reader.fill(serverSide.fd());
  EXPECT_EQ(reader.next(request).status, FrameResult::Status::NeedMore);
  EXPECT_TRUE(reader.waitingForBody());

  clientSend("456789GET");
  reader.fill(serverSide.fd());
  ASSERT_EQ(reader.next(request).status, FrameResult::Status::Complete);
  EXPECT_EQ(request.body(), "0123456789");
  EXPECT_FALSE(reader.waitingForBody());
  // Start of the next request stays buffered.
  EXPECT_EQ(reader.bufferedBytes(), 3U);
}

TEST_F(WireReaderTest, PipelinedRequestsFramedOneByOne) {
  reader.append(
      "GET /a HTTP/1.1\r\nHost: x\r\n\r\n"
      "GET /b HTTP/1.1\r\nHost: x\r\n\r\n");
  ASSERT_EQ(reader.next(request).status, FrameResult::Status::Complete);
  EXPECT_EQ(request.path(), "/a");
  HttpRequest second;
  ASSERT_EQ(reader.next(second).status, FrameResult::Status::Complete);
  EXPECT_EQ(second.path(), "/b");
  EXPECT_EQ(reader.bufferedBytes(), 0U);
}

TEST_F(WireReaderTest, BodyExactlyAtLimitAccepted) {
  reader.append("POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 64\r\n\r\n");
  reader.append(std::string(kMaxBodyBytes, 'a'));
  ASSERT_EQ(reader.next(request).status, FrameResult::Status::Complete);
  EXPECT_EQ(request.body().size(), kMaxBodyBytes);
}

TEST_F(WireReaderTest, DeclaredBodyAboveLimitRejectedBeforeReadingIt) {
  reader.append("POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 65\r\n\r\n");
  const FrameResult result = reader.next(request);
  EXPECT_EQ(result.status, FrameResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::BodyTooLarge);
}

TEST_F(WireReaderTest, DeclaredBodyBeyondSizeTypeIsTooLarge) {
  reader.append("POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 99999999999999999999999\r\n\r\n");
  const FrameResult result = reader.next(request);
  EXPECT_EQ(result.status, FrameResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::BodyTooLarge);
}

TEST_F(WireReaderTest, ParseErrorReported) {
  reader.append("INVALID\r\n\r\n");
  const FrameResult result = reader.next(request);
  EXPECT_EQ(result.status, FrameResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::Malformed);
}

TEST_F(WireReaderTest, UnknownMethodConsumesBody) {
  reader.append("BREW /pot HTTP/1.1\r\nHost: x\r\nContent-Length: 3\r\n\r\nabcGET / HTTP/1.1\r\nHost: x\r\n\r\n");
  const FrameResult result = reader.next(request);
  EXPECT_EQ(result.status, FrameResult::Status::Error);
  EXPECT_EQ(result.error, http::ErrorKind::UnknownMethod);

  HttpRequest next;
  ASSERT_EQ(reader.next(next).status, FrameResult::Status::Complete);
  EXPECT_EQ(next.path(), "/");
}

TEST_F(WireReaderTest, DiscardBufferedResetsFraming) {
  reader.append("POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 10\r\n\r\n01");
  EXPECT_EQ(reader.next(request).status, FrameResult::Status::NeedMore);
  reader.discardBuffered();
  EXPECT_EQ(reader.bufferedBytes(), 0U);
  EXPECT_FALSE(reader.waitingForBody());

  HttpRequest fresh;
  reader.append("GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(reader.next(fresh).status, FrameResult::Status::Complete);
}

}  // namespace tern
