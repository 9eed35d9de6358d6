#include "tern/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "tern/http-constants.hpp"
#include "tern/http-status-code.hpp"

namespace tern {

TEST(HttpResponseTest, DefaultIs200WithEmptyBody) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.reason(), "OK");
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponseTest, StatusCodeRange) {
  EXPECT_NO_THROW(HttpResponse(100));
  EXPECT_NO_THROW(HttpResponse(599));
  EXPECT_THROW(HttpResponse(99), std::invalid_argument);
  EXPECT_THROW(HttpResponse(600), std::invalid_argument);
  HttpResponse resp;
  EXPECT_THROW(resp.status(1000), std::invalid_argument);
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
}

TEST(HttpResponseTest, UnknownCodeHasEmptyReason) {
  EXPECT_TRUE(HttpResponse(299).reason().empty());
  EXPECT_EQ(HttpResponse(http::StatusCodeNotFound).reason(), "Not Found");
}

TEST(HttpResponseTest, BodySetsContentType) {
  HttpResponse resp = HttpResponse().body("<p>hi</p>", http::ContentTypeTextHtml);
  EXPECT_EQ(resp.body(), "<p>hi</p>");
  EXPECT_EQ(resp.headerValueOrEmpty("content-type"), http::ContentTypeTextHtml);

  resp.body("plain");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
  ASSERT_EQ(resp.headers().size(), 1U);

  resp.body("raw", "");
  EXPECT_EQ(resp.body(), "raw");
  EXPECT_EQ(resp.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlain);
}

TEST(HttpResponseTest, BodyConstructor) {
  HttpResponse resp(std::string("hello"));
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "hello");
}

TEST(HttpResponseTest, HeaderReplacesAddHeaderAppends) {
  HttpResponse resp;
  resp.addHeader("X-A", "1").addHeader("x-a", "2").addHeader("X-B", "3");
  ASSERT_EQ(resp.headers().size(), 3U);
  EXPECT_EQ(resp.headerValueOrEmpty("X-A"), "1");

  resp.header("X-a", "4");
  ASSERT_EQ(resp.headers().size(), 2U);
  EXPECT_EQ(resp.headers()[0].name, "X-B");
  EXPECT_EQ(resp.headers()[1].name, "X-a");
  EXPECT_EQ(resp.headerValueOrEmpty("x-A"), "4");
  EXPECT_FALSE(resp.headerValue("X-C"));
}

TEST(HttpResponseTest, RvalueChaining) {
  auto resp = HttpResponse(http::StatusCodeCreated).header("Location", "/items/1").body("created");
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.headerValueOrEmpty("Location"), "/items/1");
  EXPECT_EQ(resp.body(), "created");
}

TEST(HttpResponseTest, RejectsHeaderInjection) {
  HttpResponse resp;
  EXPECT_THROW(resp.header("X-A", "v\r\nSet-Cookie: evil=1"), std::invalid_argument);
  EXPECT_THROW(resp.header("X-A", "v\n"), std::invalid_argument);
  EXPECT_THROW(resp.addHeader("Bad Name", "v"), std::invalid_argument);
  EXPECT_THROW(resp.addHeader("", "v"), std::invalid_argument);
  EXPECT_THROW(resp.addHeader("X:Y", "v"), std::invalid_argument);
  EXPECT_TRUE(resp.headers().empty());
  EXPECT_NO_THROW(resp.header("X-Tab", "a\tb"));
}

}  // namespace tern
