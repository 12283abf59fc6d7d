#include "commands.hpp"

#include <optional>
#include <utility>

#include "expiringdict/v1.hpp"
#include "internal/core/options.hpp"
#include "internal/observability/logging.hpp"

namespace expiringdict::cli {

using namespace expiringdict::v1;
using expiringdict::observability::StringField;

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  expiringdictctl <config.yaml> get <key>\n"
      << "  expiringdictctl <config.yaml> set <key> <json>\n"
      << "  expiringdictctl <config.yaml> del <key>\n"
      << "  expiringdictctl <config.yaml> has <key>\n"
      << "  expiringdictctl <config.yaml> len\n"
      << "  expiringdictctl <config.yaml> keys [id|key|expire] [--reverse]\n"
      << "  expiringdictctl <config.yaml> items [id|key|expire] [--reverse]\n"
      << "  expiringdictctl <config.yaml> postpone <key>\n"
      << "  expiringdictctl <config.yaml> postpone-all\n"
      << "  expiringdictctl <config.yaml> clear\n";
}

namespace {

std::optional<Order> ParseOrder(const std::string& value) {
  if (value == "id") return Order::kId;
  if (value == "key") return Order::kKey;
  if (value == "expire") return Order::kExpire;
  return std::nullopt;
}

struct Listing {
  Order order   = Order::kId;
  bool  reverse = false;
};

std::optional<Listing> ParseListing(const std::vector<std::string>& args, std::ostream& err) {
  Listing listing;
  for (const auto& arg : args) {
    if (arg == "--reverse") {
      listing.reverse = true;
      continue;
    }
    auto order = ParseOrder(arg);
    if (!order) {
      err << "invalid order '" << arg << "', expected id, key or expire\n";
      return std::nullopt;
    }
    listing.order = *order;
  }
  return listing;
}

template <typename S>
class Executor {
 public:
  Executor(const SessionOptions& options, S serializer, std::ostream& out, std::ostream& err)
      : session_(options, std::move(serializer)), out_(out), err_(err) {
  }

  int Execute(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "get") {
      if (!Need(args, 1)) return kUsageError;
      return session_.Run([&](Connection<S>& d) {
        auto value = d.Find(args[0]);
        if (!value) {
          err_ << "not found: " << args[0] << "\n";
          return kNotFound;
        }
        out_ << ToJson(*value) << "\n";
        return kOk;
      });
    }

    if (cmd == "has") {
      if (!Need(args, 1)) return kUsageError;
      return session_.Run([&](Connection<S>& d) {
        const bool found = d.Contains(args[0]);
        out_ << (found ? "true" : "false") << "\n";
        return found ? kOk : kNotFound;
      });
    }

    if (cmd == "set") {
      if (!Need(args, 2)) return kUsageError;
      auto value = ParseJson(args[1]);
      session_.Run([&](Connection<S>& d) { d.Set(args[0], value); });
      return kOk;
    }

    if (cmd == "del") {
      if (!Need(args, 1)) return kUsageError;
      try {
        session_.Run([&](Connection<S>& d) { d.Erase(args[0]); });
      } catch (const NotFound& e) {
        err_ << e.what() << "\n";
        return kNotFound;
      }
      return kOk;
    }

    if (cmd == "len") {
      if (!Need(args, 0)) return kUsageError;
      session_.Run([&](Connection<S>& d) { out_ << d.Size() << "\n"; });
      return kOk;
    }

    if (cmd == "keys" || cmd == "items") {
      auto listing = ParseListing(args, err_);
      if (!listing) return kUsageError;
      session_.Run([&](Connection<S>& d) {
        if (cmd == "keys") {
          auto view = d.Keys(listing->order);
          for (const auto& key : listing->reverse ? view.Reversed() : view) out_ << key << "\n";
        } else {
          auto view = d.Items(listing->order);
          for (const auto& [key, value] : listing->reverse ? view.Reversed() : view) {
            out_ << key << "\t" << ToJson(value) << "\n";
          }
        }
      });
      return kOk;
    }

    if (cmd == "postpone") {
      if (!Need(args, 1)) return kUsageError;
      session_.Run([&](Connection<S>& d) { d.Postpone(args[0]); });
      return kOk;
    }

    if (cmd == "postpone-all") {
      if (!Need(args, 0)) return kUsageError;
      session_.Run([](Connection<S>& d) { d.PostponeAll(); });
      return kOk;
    }

    if (cmd == "clear") {
      if (!Need(args, 0)) return kUsageError;
      session_.Run([](Connection<S>& d) { d.Clear(); });
      return kOk;
    }

    err_ << "unknown command '" << cmd << "'\n";
    PrintUsage(err_);
    return kUsageError;
  }

 private:
  bool Need(const std::vector<std::string>& args, std::size_t n) {
    if (args.size() == n) return true;
    PrintUsage(err_);
    return false;
  }

  Session<S>    session_;
  std::ostream& out_;
  std::ostream& err_;
};

template <typename S>
int Execute(const SessionOptions& options, S serializer, const std::string& cmd, const std::vector<std::string>& args,
            std::ostream& out, std::ostream& err) {
  return Executor<S>(options, std::move(serializer), out, err).Execute(cmd, args);
}

} // namespace

int RunCommand(const expiringdict::runtime::config::StoreConfig& store, const std::string& cmd,
               const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  try {
    const auto options = expiringdict::core::OptionsFromConfig(store);

    switch (store.serializer()) {
      case expiringdict::runtime::config::SERIALIZER_KIND_JSON:
        return Execute(options, JsonSerializer{}, cmd, args, out, err);
      case expiringdict::runtime::config::SERIALIZER_KIND_BINARY:
        return Execute(options, ValueSerializer{}, cmd, args, out, err);
      case expiringdict::runtime::config::SERIALIZER_KIND_COMPRESSED:
      case expiringdict::runtime::config::SERIALIZER_KIND_UNSPECIFIED:
      default:
        return Execute(options, DefaultSerializer{}, cmd, args, out, err);
    }
  } catch (const std::exception& e) {
    EXPIRINGDICT_LOG_ERROR("command failed", {StringField("command", cmd), StringField("error", e.what())});
    err << "error: " << e.what() << "\n";
    return kFailure;
  }
}

} // namespace expiringdict::cli
