#include "trellis/timestring.hpp"

#include <cstddef>
#include <string>

#include "trellis/timedef.hpp"

namespace trellis {

std::string ISO8601String(SysTimePoint timePoint) {
  char buf[kISO8601WithMsStrLen];
  return {buf, TimeToStringISO8601UTCWithMs(timePoint, buf)};
}

std::string RFC7231String(SysTimePoint timePoint) {
  char buf[kRFC7231DateStrLen];
  return {buf, TimeToStringRFC7231(timePoint, buf)};
}

}  // namespace trellis
