#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include "tern/simple-charconv.hpp"
#include "tern/timedef.hpp"

namespace tern {

// Length of an IMF-fixdate, for instance "Sun, 06 Nov 1994 08:49:37 GMT".
inline constexpr std::size_t kRFC7231DateStrLen = 29;

// Writes tp as an IMF-fixdate (RFC 9110 5.6.7) into out, which must have room for kRFC7231DateStrLen chars.
// No null terminator is written. Returns the position past the last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  constexpr std::string_view kDayNames = "SunMonTueWedThuFriSat";
  constexpr std::string_view kMonthNames = "JanFebMarAprMayJunJulAugSepOctNovDec";

  const auto secTp = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto dayTp = std::chrono::floor<std::chrono::days>(secTp);
  const std::chrono::year_month_day ymd{dayTp};
  const std::chrono::hh_mm_ss timeOfDay{secTp - dayTp};

  out = CopyChars(out, kDayNames.substr(3U * std::chrono::weekday{dayTp}.c_encoding(), 3));
  out = CopyChars(out, ", ");
  out = WriteFixedDigits<2>(out, static_cast<unsigned>(ymd.day()));
  *out++ = ' ';
  out = CopyChars(out, kMonthNames.substr(3U * (static_cast<unsigned>(ymd.month()) - 1U), 3));
  *out++ = ' ';
  out = WriteFixedDigits<4>(out, static_cast<int>(ymd.year()));
  *out++ = ' ';
  out = WriteFixedDigits<2>(out, timeOfDay.hours().count());
  *out++ = ':';
  out = WriteFixedDigits<2>(out, timeOfDay.minutes().count());
  *out++ = ':';
  out = WriteFixedDigits<2>(out, timeOfDay.seconds().count());
  return CopyChars(out, " GMT");
}

}  // namespace tern
