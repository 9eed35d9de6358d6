#include "tern/response-serializer.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>

#include "tern/http-constants.hpp"
#include "tern/http-header.hpp"
#include "tern/http-response.hpp"
#include "tern/simple-charconv.hpp"
#include "tern/string-equal-ignore-case.hpp"
#include "tern/timestring.hpp"

namespace tern {

namespace {

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

}  // namespace

bool ResponseSerializer::IsReservedHeader(std::string_view name) noexcept {
  return CaseInsensitiveEqual(name, http::Date) || CaseInsensitiveEqual(name, http::Server) ||
         CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::Connection) ||
         CaseInsensitiveEqual(name, http::TransferEncoding);
}

bool ResponseSerializer::HandlerRequestsClose(const HttpResponse& response) noexcept {
  for (const http::Header& header : response.headers()) {
    if (CaseInsensitiveEqual(header.name, http::Connection) && ContainsTokenIgnoreCase(header.value, http::close)) {
      return true;
    }
  }
  return false;
}

std::string ResponseSerializer::serialize(const HttpResponse& response, const SerializeOptions& options) {
  const std::string_view body = response.body();
  const std::string_view reason = response.reason();

  std::string out;
  out.reserve(128UL + reason.size() + options.serverName.size() + body.size());

  // Status line. The SP before the reason is kept even when the reason is empty.
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  char statusBuf[3];
  WriteFixedDigits<3>(statusBuf, response.status());
  out.append(statusBuf, sizeof(statusBuf));
  out.push_back(' ');
  out.append(reason);
  out.append(http::CRLF);

  for (const http::Header& header : response.headers()) {
    if (!IsReservedHeader(header.name)) {
      AppendHeader(out, header.name, header.value);
    }
  }

  char dateBuf[kRFC7231DateStrLen];
  TimeToStringRFC7231(options.now, dateBuf);
  AppendHeader(out, http::Date, std::string_view(dateBuf, sizeof(dateBuf)));
  AppendHeader(out, http::Server, options.serverName);

  char lenBuf[24];
  const char* lenEnd = std::to_chars(lenBuf, lenBuf + sizeof(lenBuf), body.size()).ptr;
  AppendHeader(out, http::ContentLength, std::string_view(lenBuf, static_cast<std::size_t>(lenEnd - lenBuf)));

  AppendHeader(out, http::Connection, options.keepAlive ? http::keepalive : http::close);
  out.append(http::CRLF);

  if (!options.headRequest) {
    out.append(body);
  }
  return out;
}

}  // namespace tern
