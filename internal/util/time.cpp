#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace finq::util {

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  // Pre-epoch time points floor towards the earlier second.
  auto whole = Clock::to_time_t(TimePoint(secs));
  if (micros < 0) {
    micros += 1000000;
    whole -= 1;
  }

  std::tm utc{};
  gmtime_r(&whole, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
  return out.str();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

} // namespace finq::util
