#include "evichain/timestamp.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace evichain {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (ms < 0)
    ms += 1000;
  std::time_t secs = system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&secs, &utc);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  std::ostringstream oss;
  oss << buf << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

std::string isoTimestamp() {
  return isoTimestamp(std::chrono::system_clock::now());
}

std::string fileSafeTimestamp(const std::string &iso) {
  std::string out = iso;
  std::replace(out.begin(), out.end(), ':', '-');
  std::replace(out.begin(), out.end(), '.', '-');
  return out;
}

} // namespace evichain
