#pragma once

#include <cstddef>
#include <string_view>

namespace tern::http {

// Header field names are case-insensitive (RFC 7230). They are stored here in their canonical form for emission;
// parsing code compares them with CaseInsensitiveEqual.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Minimal request line: "GET / HTTP/1.1\r\n"
inline constexpr std::size_t kHttpReqLineMinLen = 3UL + 3UL + HTTP11Sv.size() + CRLF.size();

// Connection header tokens (lowercase, compared case-insensitively)
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";


}  // namespace tern::http
