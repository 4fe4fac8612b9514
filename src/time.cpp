#include "prism/time.hpp"

#include "prism/util.hpp"

#include <charconv>
#include <cstdio>

// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }

namespace prism::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  // Render local wall-clock time as if it were UTC and subtract the real UTC instant
  const std::time_t local_as_utc = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  return static_cast<int>((local_as_utc - utc_epoch) / 60);
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  const char sign = minutes >= 0 ? '+' : '-';
  const int m = minutes >= 0 ? minutes : -minutes;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, (m / 60) % 100, m % 60);
  return std::string(buf);
}

std::string make_signature(const Identity &id, std::time_t when, int tz_minutes) {
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(when)) + " " +
         tz_offset_string(tz_minutes);
}

ParsedSignature parse_signature(std::string_view line) {
  ParsedSignature out;
  const auto lt = line.find('<');
  const auto gt = line.find('>', lt == std::string_view::npos ? 0 : lt);
  if (lt == std::string_view::npos || gt == std::string_view::npos) {
    out.name = std::string(strutil::trim(line));
    return out;
  }
  out.name = std::string(strutil::trim(line.substr(0, lt)));
  out.email = std::string(line.substr(lt + 1, gt - lt - 1));

  // "<epoch> <tz>" after the email
  const std::string_view rest = strutil::trim(line.substr(gt + 1));
  const std::string_view epoch = rest.substr(0, rest.find(' '));
  std::int64_t when = 0;
  const auto [ptr, ec] = std::from_chars(epoch.data(), epoch.data() + epoch.size(), when);
  if (!epoch.empty() && ec == std::errc{} && ptr == epoch.data() + epoch.size()) {
    out.when = when;
  }
  return out;
}

} // namespace prism::timeutil
