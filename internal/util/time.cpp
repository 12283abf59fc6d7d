#include "time.hpp"

namespace expiringdict::util {

Lifespan FromProto(const google::protobuf::Duration& d) {
  // sub-second parts are truncated toward zero; expire has second resolution
  return Lifespan(d.seconds());
}

} // namespace expiringdict::util
