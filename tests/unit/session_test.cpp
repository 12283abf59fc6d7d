#include "internal/core/session.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/serializer/codecs.hpp"
#include "internal/util/errors.hpp"

namespace {

using expiringdict::core::Connection;
using expiringdict::core::Scope;
using expiringdict::core::Session;
using expiringdict::core::SessionOptions;
using expiringdict::serializer::RawSerializer;
using expiringdict::util::DirectoryNotFound;
using expiringdict::util::InvalidIdentifier;
using expiringdict::util::NotFound;
using expiringdict::util::ReadOnlyViolation;
using expiringdict::util::ReentrancyViolation;

using RawSession = Session<RawSerializer>;

uint64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string TempDbPath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "expiringdict_session_tests";
  std::filesystem::create_directories(base_dir);
  return (base_dir / (test_name + "_" + std::to_string(NowNs()) + ".db")).string();
}

void RemoveDb(const std::string& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

SessionOptions OptionsFor(const std::string& path) {
  SessionOptions options;
  options.path = path;
  return options;
}

void TestEnterTwiceIsRejected() {
  const auto path = TempDbPath("reentrancy");
  {
    RawSession session(OptionsFor(path));
    session.Enter();

    bool threw = false;
    try {
      session.Enter();
    } catch (const ReentrancyViolation&) {
      threw = true;
    }
    assert(threw);
    assert(session.IsEntered());

    session.Commit();
    assert(!session.IsEntered());

    // idle again, so entering works
    session.Enter();
    session.Rollback();
  }
  RemoveDb(path);
}

void TestCommitWithoutEnterIsLogicError() {
  const auto path = TempDbPath("not_entered");
  {
    RawSession session(OptionsFor(path));

    bool threw = false;
    try {
      session.Commit();
    } catch (const std::logic_error&) {
      threw = true;
    }
    assert(threw);
  }
  RemoveDb(path);
}

void TestRunCommitsAndReturns() {
  const auto path = TempDbPath("run_commit");
  {
    RawSession session(OptionsFor(path));
    session.Run([](Connection<RawSerializer>& c) { c.Set("foo", "bar"); });

    const auto size = session.Run([](Connection<RawSerializer>& c) { return c.Size(); });
    assert(size == 1);

    const auto value = session.Run([](Connection<RawSerializer>& c) { return c.Get("foo"); });
    assert(value == "bar");
  }
  RemoveDb(path);
}

void TestRunRollsBackOnException() {
  const auto path = TempDbPath("run_rollback");
  {
    RawSession session(OptionsFor(path));

    bool threw = false;
    try {
      session.Run([](Connection<RawSerializer>& c) {
        c.Set("foo", "bar");
        throw std::runtime_error("abort");
      });
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()) == "abort";
    }
    assert(threw);
    assert(!session.IsEntered());

    const bool present = session.Run([](Connection<RawSerializer>& c) { return c.Contains("foo"); });
    assert(!present);
  }
  RemoveDb(path);
}

void TestRunKeepsOriginalErrorWhenRollbackFails() {
  const auto path = TempDbPath("run_rollback_fails");
  {
    RawSession session(OptionsFor(path));

    bool threw = false;
    try {
      session.Run([](Connection<RawSerializer>& c) {
        c.Set("foo", "bar");
        // ends the transaction behind the session's back, so ROLLBACK fails
        c.Db().Exec("COMMIT;");
        throw std::runtime_error("abort");
      });
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()) == "abort";
    }
    assert(threw);
    assert(!session.IsEntered());
    assert(!session.IsHandleOpen());

    const bool present = session.Run([](Connection<RawSerializer>& c) { return c.Contains("foo"); });
    assert(present);
  }
  RemoveDb(path);
}

void TestScopeWithoutCommitRollsBack() {
  const auto path = TempDbPath("scope");
  {
    RawSession session(OptionsFor(path));
    {
      Scope<RawSerializer> scope(session);
      scope->Set("kept", "1");
      scope.Commit();
    }
    {
      Scope<RawSerializer> scope(session);
      scope->Set("dropped", "2");
    }
    assert(!session.IsEntered());

    Scope<RawSerializer> scope(session);
    assert((*scope).Contains("kept"));
    assert(!scope->Contains("dropped"));
    scope.Rollback();
  }
  RemoveDb(path);
}

void TestErasingMissingKeyThrowsNotFound() {
  const auto path = TempDbPath("not_found");
  {
    RawSession session(OptionsFor(path));
    auto&      c = session.Enter();

    bool threw = false;
    try {
      c.Erase("missing");
    } catch (const NotFound& e) {
      threw = e.Key() == "missing";
    }
    assert(threw);

    threw = false;
    try {
      (void)c.Get("missing");
    } catch (const NotFound&) {
      threw = true;
    }
    assert(threw);
    assert(!c.Find("missing").has_value());

    session.Rollback();
  }
  RemoveDb(path);
}

void TestHandleIsClosedAfterEachEntryByDefault() {
  const auto path = TempDbPath("close_on_exit");
  {
    RawSession session(OptionsFor(path));
    assert(!session.IsHandleOpen());

    session.Enter();
    assert(session.IsHandleOpen());
    session.Commit();
    assert(!session.IsHandleOpen());
  }
  RemoveDb(path);
}

void TestKeepOpenReusesHandleUntilClose() {
  const auto path = TempDbPath("keep_open");
  {
    auto options      = OptionsFor(path);
    options.keep_open = true;
    RawSession session(options);

    auto& first = session.Enter();
    auto* db    = &first.Db();
    first.Set("foo", "bar");
    session.Commit();
    assert(session.IsHandleOpen());

    auto& second = session.Enter();
    assert(&second.Db() == db);
    assert(second.Get("foo") == "bar");

    bool threw = false;
    try {
      session.Close();
    } catch (const ReentrancyViolation&) {
      threw = true;
    }
    assert(threw);

    session.Commit();
    session.Close();
    assert(!session.IsHandleOpen());

    // closing is not final; the next entry reopens
    const bool present = session.Run([](Connection<RawSerializer>& c) { return c.Contains("foo"); });
    assert(present);
  }
  RemoveDb(path);
}

void TestMissingDirectoryFailsOnEnter() {
  const auto path = (std::filesystem::temp_directory_path() / ("expiringdict_missing_" + std::to_string(NowNs())) /
                     "nested" / "store.db")
                        .string();

  RawSession session(OptionsFor(path));

  bool threw = false;
  try {
    session.Enter();
  } catch (const DirectoryNotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!session.IsEntered());
  assert(!session.IsHandleOpen());
  assert(!std::filesystem::exists(std::filesystem::path(path).parent_path()));
}

void TestInvalidTableNameFailsAtConstruction() {
  auto options  = OptionsFor(TempDbPath("bad_table"));
  options.table = std::string("bad\0name", 8);

  bool threw = false;
  try {
    RawSession session(options);
  } catch (const InvalidIdentifier&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(options.path));
}

void TestReadOnlySessionRejectsMutations() {
  const auto path = TempDbPath("read_only");
  {
    RawSession writer(OptionsFor(path));
    writer.Run([](Connection<RawSerializer>& c) { c.Set("foo", "bar"); });
  }
  {
    auto options      = OptionsFor(path);
    options.read_only = true;
    RawSession reader(options);

    auto& c = reader.Enter();
    assert(c.Get("foo") == "bar");
    assert(c.Size() == 1);

    bool threw = false;
    try {
      c.Set("baz", "1337");
    } catch (const ReadOnlyViolation&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      c.PostponeAll();
    } catch (const ReadOnlyViolation&) {
      threw = true;
    }
    assert(threw);

    reader.Commit();
  }
  RemoveDb(path);
}

void TestLifespanAppliesToLaterEntries() {
  const auto path = TempDbPath("lifespan");
  {
    RawSession session(OptionsFor(path));
    assert(session.Lifespan() == std::chrono::hours(24 * 7));

    session.SetLifespan(std::chrono::seconds(30));
    auto& c = session.Enter();
    assert(c.Lifespan() == std::chrono::seconds(30));

    // changing it on the connection does not leak back into the session
    c.SetLifespan(std::chrono::seconds(5));
    session.Rollback();
    assert(session.Lifespan() == std::chrono::seconds(30));
  }
  RemoveDb(path);
}

} // namespace

int main() {
  TestEnterTwiceIsRejected();
  TestCommitWithoutEnterIsLogicError();
  TestRunCommitsAndReturns();
  TestRunRollsBackOnException();
  TestRunKeepsOriginalErrorWhenRollbackFails();
  TestScopeWithoutCommitRollsBack();
  TestErasingMissingKeyThrowsNotFound();
  TestHandleIsClosedAfterEachEntryByDefault();
  TestKeepOpenReusesHandleUntilClose();
  TestMissingDirectoryFailsOnEnter();
  TestInvalidTableNameFailsAtConstruction();
  TestReadOnlySessionRejectsMutations();
  TestLifespanAppliesToLaterEntries();

  std::cout << "expiringdict_unit_session: pass\n";
  return 0;
}
