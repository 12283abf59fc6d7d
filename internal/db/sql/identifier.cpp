#include "identifier.hpp"

#include "internal/util/errors.hpp"

namespace expiringdict::db::sql {

Identifier::Identifier(std::string value) : value_(std::move(value)) {
  if (value_.find('\0') != std::string::npos) {
    throw util::InvalidIdentifier("sqlite identifier must not contain any null bytes");
  }
}

std::string Identifier::Quoted() const {
  std::string out;
  out.reserve(value_.size() + 2);
  out.push_back('"');
  for (char c : value_) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

Identifier Identifier::operator+(std::string_view suffix) const {
  return Identifier(value_ + std::string(suffix));
}

} // namespace expiringdict::db::sql
