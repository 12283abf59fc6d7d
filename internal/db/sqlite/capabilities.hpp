#pragma once

namespace expiringdict::db::sqlite {

/*
  Engine features that change the generated SQL.

  Resolved once from the linked library version; everything downstream
  branches on these flags instead of on version numbers.
*/
struct Capabilities {
  bool atomic_upsert = false; // INSERT ... ON CONFLICT DO UPDATE (3.24)
  bool strict_tables = false; // STRICT tables, ANY column type  (3.37)
  bool unixepoch     = false; // UNIXEPOCH()                     (3.38)

  // version number as returned by sqlite3_libversion_number()
  static Capabilities ForVersion(int version_number);

  // capabilities of the linked sqlite library
  static const Capabilities& Detect();
};

} // namespace expiringdict::db::sqlite
