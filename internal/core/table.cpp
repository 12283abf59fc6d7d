#include "table.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace expiringdict::core {

Table::Table(std::shared_ptr<db::sqlite::SqliteDB> db, db::sql::Identifier name, const db::sqlite::Capabilities& caps)
    : db_(std::move(db)), name_(std::move(name)), queries_(name_, caps) {
  db::sql::SchemaManager(*db_, caps).Ensure(name_);
}

void Table::CheckWritable(const char* operation) const {
  if (db_->ReadOnly()) {
    throw util::ReadOnlyViolation(std::string(operation) + " on read-only table " + name_.Value());
  }
}

int64_t Table::Count() const {
  auto st = db_->Prepare(queries_.count);
  return st.Step() ? st.ColumnInt64(0) : 0;
}

bool Table::Contains(const std::string& key) const {
  auto st = db_->Prepare(queries_.contains);
  st.BindText(1, key);
  return st.Step();
}

std::optional<std::string> Table::Find(const std::string& key) const {
  auto st = db_->Prepare(queries_.select_value);
  st.BindText(1, key);
  if (!st.Step()) return std::nullopt;
  return st.ColumnBlob(0);
}

void Table::Put(const std::string& key, std::string_view bytes, util::Lifespan lifespan) {
  CheckWritable("set");

  if (!queries_.upsert.empty()) {
    auto st = db_->Prepare(queries_.upsert);
    st.BindText(1, key).BindInt64(2, lifespan.count()).BindBlob(3, bytes);
    st.Run();
    return;
  }

  // TODO: drop this branch once sqlite 3.24 is the minimum; it races
  // against concurrent DEFERRED writers between the check and the write.
  if (Contains(key)) {
    auto st = db_->Prepare(queries_.update);
    st.BindInt64(1, lifespan.count()).BindBlob(2, bytes).BindText(3, key);
    st.Run();
  } else {
    auto st = db_->Prepare(queries_.insert);
    st.BindText(1, key).BindInt64(2, lifespan.count()).BindBlob(3, bytes);
    st.Run();
  }
}

bool Table::Remove(const std::string& key) {
  CheckWritable("delete");

  auto st = db_->Prepare(queries_.erase);
  st.BindText(1, key);
  st.Run();
  return db_->Changes() == 1;
}

void Table::Clear() {
  CheckWritable("clear");
  db_->Prepare(queries_.clear).Run();
}

void Table::Postpone(const std::string& key, util::Lifespan lifespan) {
  CheckWritable("postpone");

  auto st = db_->Prepare(queries_.postpone);
  st.BindInt64(1, lifespan.count()).BindText(2, key);
  st.Run();
}

void Table::PostponeAll(util::Lifespan lifespan) {
  CheckWritable("postpone_all");

  auto st = db_->Prepare(queries_.postpone_all);
  st.BindInt64(1, lifespan.count());
  st.Run();
}

db::sqlite::Statement Table::Scan(const char* columns, Order order, bool reverse) const {
  return db_->Prepare(queries_.Select(columns, order, reverse));
}

} // namespace expiringdict::core
