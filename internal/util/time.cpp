#include "time.hpp"

namespace faucet::util {

TimePoint Now() {
  return Clock::now();
}

Millis ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Millis>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

Millis ToMillisOr(const google::protobuf::Duration& d, Millis fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) return fallback;
  return ToMillis(d);
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace faucet::util
