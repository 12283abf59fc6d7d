#pragma once

#include <string>
#include <string_view>

namespace expiringdict::db::sql {

/*
  An SQL identifier (table, index or trigger name).

  Table names are the only user-controlled text ever spliced into
  generated statements, and they only get there through Quoted().
  Values always go through bound parameters.

  A name containing a NUL byte is rejected at construction; sqlite
  cannot represent it inside an identifier.
*/
class Identifier {
 public:
  explicit Identifier(std::string value);

  const std::string& Value() const {
    return value_;
  }

  // "name" with every embedded double quote doubled
  std::string Quoted() const;

  // raw suffix, quoted together with the name: "tbl_expire_index"
  Identifier operator+(std::string_view suffix) const;

 private:
  std::string value_;
};

} // namespace expiringdict::db::sql
