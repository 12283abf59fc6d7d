#include "capabilities.hpp"

#include <sqlite3.h>

namespace expiringdict::db::sqlite {

Capabilities Capabilities::ForVersion(int version_number) {
  Capabilities caps;
  caps.atomic_upsert = version_number >= 3024000;
  caps.strict_tables = version_number >= 3037000;
  caps.unixepoch     = version_number >= 3038000;
  return caps;
}

const Capabilities& Capabilities::Detect() {
  static const Capabilities caps = ForVersion(sqlite3_libversion_number());
  return caps;
}

} // namespace expiringdict::db::sqlite
