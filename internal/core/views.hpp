#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "table.hpp"

namespace expiringdict::core {

/*
  Lazy, restartable, reversible sequence over one table.

  Nothing is queried until begin(); every begin() runs a fresh SELECT, so
  two iterations never share a position. Reversed() flips ASC/DESC.

  A view borrows the Table of its Connection and must not outlive it.

  Extract maps the current row of a statement to an element and names
  the columns it reads (Extract::kColumns).
*/
template <typename Extract>
class View {
 public:
  using value_type = decltype(std::declval<const Extract&>()(std::declval<const db::sqlite::Statement&>()));

  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = View::value_type;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;

    iterator() = default;

    iterator(db::sqlite::Statement stmt, Extract extract)
        : stmt_(std::make_shared<db::sqlite::Statement>(std::move(stmt))), extract_(std::move(extract)) {
      Advance();
    }

    reference operator*() const {
      return *current_;
    }

    pointer operator->() const {
      return &*current_;
    }

    iterator& operator++() {
      Advance();
      return *this;
    }

    void operator++(int) {
      Advance();
    }

    // iterators only compare meaningfully against end()
    friend bool operator==(const iterator& a, const iterator& b) {
      return a.stmt_ == b.stmt_;
    }

   private:
    void Advance() {
      if (stmt_ && stmt_->Step()) {
        current_ = extract_(*stmt_);
        return;
      }
      stmt_.reset();
      current_.reset();
    }

    // shared so the iterator stays copyable; copies share one cursor
    std::shared_ptr<db::sqlite::Statement> stmt_;
    Extract                                extract_{};
    std::optional<value_type>              current_;
  };

  View(const Table* table, Order order, bool reverse, Extract extract)
      : table_(table), order_(order), reverse_(reverse), extract_(std::move(extract)) {
  }

  iterator begin() const {
    return iterator(table_->Scan(Extract::kColumns, order_, reverse_), extract_);
  }

  iterator end() const {
    return iterator();
  }

  View Reversed() const {
    return View(table_, order_, !reverse_, extract_);
  }

  std::vector<value_type> ToVector() const {
    std::vector<value_type> out;
    for (auto it = begin(); it != end(); ++it) {
      out.push_back(*it);
    }
    return out;
  }

 private:
  const Table* table_;
  Order        order_;
  bool         reverse_;
  Extract      extract_;
};

struct KeyColumn {
  static constexpr const char* kColumns = "key";

  std::string operator()(const db::sqlite::Statement& st) const {
    return st.ColumnText(0);
  }
};

template <typename S>
struct ValueColumn {
  static constexpr const char* kColumns = "value";

  const S* serializer = nullptr;

  typename S::value_type operator()(const db::sqlite::Statement& st) const {
    return serializer->Loads(st.ColumnBlob(0));
  }
};

template <typename S>
struct ItemColumns {
  static constexpr const char* kColumns = "key, value";

  const S* serializer = nullptr;

  std::pair<std::string, typename S::value_type> operator()(const db::sqlite::Statement& st) const {
    return {st.ColumnText(0), serializer->Loads(st.ColumnBlob(1))};
  }
};

using KeysView = View<KeyColumn>;

template <typename S>
using ValuesView = View<ValueColumn<S>>;

template <typename S>
using ItemsView = View<ItemColumns<S>>;

} // namespace expiringdict::core
