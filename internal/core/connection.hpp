#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/serializer/serializer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "table.hpp"
#include "views.hpp"

namespace expiringdict::core {

/*
  The expiring mapping.

  Bound to one table inside one open transaction; obtained from
  Session::Enter() and invalid once the Session commits or rolls back.
  Every operation runs immediately against sqlite and blocks.

  Set() is the only operation that evicts: the table's triggers delete
  every row whose expire is at or before now after each insert or value
  update. Reads never evict, so a dead row stays visible to Size(),
  Get() and iteration until the next Set() on the table.
*/
template <serializer::Serializer S>
class Connection {
 public:
  using value_type = typename S::value_type;

  Connection(std::shared_ptr<db::sqlite::SqliteDB> db, db::sql::Identifier table, const S& serializer,
             util::Lifespan lifespan)
      : table_(std::move(db), std::move(table)), serializer_(&serializer), lifespan_(lifespan) {
  }

  // views point at table_
  Connection(const Connection&)            = delete;
  Connection& operator=(const Connection&) = delete;

  // Changing the lifespan affects future Set()/Postpone() calls only;
  // stored expiry stamps are left alone.
  util::Lifespan Lifespan() const {
    return lifespan_;
  }

  void SetLifespan(util::Lifespan lifespan) {
    lifespan_ = lifespan;
  }

  int64_t Size() const {
    return table_.Count();
  }

  bool Empty() const {
    return Size() == 0;
  }

  bool Contains(const std::string& key) const {
    return table_.Contains(key);
  }

  // throws util::NotFound
  value_type Get(const std::string& key) const {
    auto bytes = table_.Find(key);
    if (!bytes) throw util::NotFound(key);
    return serializer_->Loads(*bytes);
  }

  std::optional<value_type> Find(const std::string& key) const {
    auto bytes = table_.Find(key);
    if (!bytes) return std::nullopt;
    return serializer_->Loads(*bytes);
  }

  void Set(const std::string& key, const value_type& value) {
    table_.Put(key, serializer_->Dumps(value), lifespan_);
  }

  // throws util::NotFound
  void Erase(const std::string& key) {
    if (!table_.Remove(key)) throw util::NotFound(key);
  }

  void Clear() {
    table_.Clear();
  }

  void Postpone(const std::string& key) {
    table_.Postpone(key, lifespan_);
  }

  void PostponeAll() {
    table_.PostponeAll(lifespan_);
  }

  KeysView Keys(Order order = Order::kId) const {
    return KeysView(&table_, order, false, KeyColumn{});
  }

  ValuesView<S> Values(Order order = Order::kId) const {
    return ValuesView<S>(&table_, order, false, ValueColumn<S>{serializer_});
  }

  ItemsView<S> Items(Order order = Order::kId) const {
    return ItemsView<S>(&table_, order, false, ItemColumns<S>{serializer_});
  }

  // iterating the mapping itself yields keys in insertion order
  KeysView::iterator begin() const {
    return Keys().begin();
  }

  KeysView::iterator end() const {
    return KeysView::iterator();
  }

  const db::sql::Identifier& TableName() const {
    return table_.Name();
  }

  // escape hatch for statements this class does not cover
  db::sqlite::SqliteDB& Db() const {
    return table_.Db();
  }

 private:
  Table          table_;
  const S*       serializer_;
  util::Lifespan lifespan_;
};

} // namespace expiringdict::core
