#include "core/database.hpp"

#include <doctest/doctest.h>

#include <filesystem>
#include <unistd.h>

#include "fakes.hpp"

namespace {

TrackedAddress row(const std::string &subscriber, const std::string &address,
                   const std::string &label, Checkpoint cp = {"H0", 1000}) {
  TrackedAddress t;
  t.subscriber_id = subscriber;
  t.address = address;
  t.label = label;
  t.checkpoint = cp;
  t.created_at = 1000;
  return t;
}

} // namespace

TEST_CASE("upsert and find")
{
  Database db(":memory:");
  db.init_schema();
  auto a = fake::addr('a');

  db.upsert(row("100", a, "cold wallet"));
  auto found = db.find("100", a);
  REQUIRE(found.has_value());
  CHECK(found->label == "cold wallet");
  CHECK(found->checkpoint == Checkpoint{"H0", 1000});
  CHECK_FALSE(db.find("200", a).has_value());
}

TEST_CASE("re-registering overwrites label and checkpoint")
{
  Database db(":memory:");
  db.init_schema();
  auto a = fake::addr('a');

  db.upsert(row("100", a, "old"));
  db.advance_checkpoint("100", a, {"H5", 5000});
  db.upsert(row("100", a, "new", {"H9", 9000}));

  CHECK(db.count() == 1);
  auto found = db.find("100", a);
  REQUIRE(found.has_value());
  CHECK(found->label == "new");
  CHECK(found->checkpoint == Checkpoint{"H9", 9000});
}

TEST_CASE("list is scoped to the subscriber")
{
  Database db(":memory:");
  db.init_schema();
  db.upsert(row("100", fake::addr('a'), "a"));
  db.upsert(row("100", fake::addr('b'), fake::addr('b')));
  db.upsert(row("200", fake::addr('c'), "c"));

  auto entries = db.list("100");
  REQUIRE(entries.size() == 2);
  CHECK(db.list("200").size() == 1);
  CHECK(db.list("300").empty());
  CHECK(db.all_tracked().size() == 3);
}

TEST_CASE("remove matches address or label exactly")
{
  Database db(":memory:");
  db.init_schema();
  auto a = fake::addr('a');
  auto b = fake::addr('b');
  db.upsert(row("100", a, "cold wallet"));
  db.upsert(row("100", b, "hot wallet"));
  db.upsert(row("200", a, "cold wallet"));

  SUBCASE("by label")
  {
    CHECK(db.remove("100", "cold wallet", "cold wallet"));
    CHECK_FALSE(db.find("100", a).has_value());
    CHECK(db.find("100", b).has_value());
    CHECK(db.find("200", a).has_value());
  }
  SUBCASE("by address")
  {
    CHECK(db.remove("100", b, b));
    CHECK_FALSE(db.find("100", b).has_value());
    CHECK(db.list("100").size() == 1);
  }
  SUBCASE("address and label are matched against their own columns")
  {
    CHECK_FALSE(db.remove("100", "cold wallet", "nothing"));
    CHECK(db.remove("100", a, "nothing"));
    CHECK(db.list("100").size() == 1);
  }
  SUBCASE("no prefix or case-insensitive match")
  {
    CHECK_FALSE(db.remove("100", "cold", "cold"));
    CHECK_FALSE(db.remove("100", "Cold Wallet", "Cold Wallet"));
    auto upper = "0x" + std::string(40, 'A');
    CHECK_FALSE(db.remove("100", upper, upper));
    CHECK(db.list("100").size() == 2);
  }
}

TEST_CASE("advance_checkpoint never resurrects a removed row")
{
  Database db(":memory:");
  db.init_schema();
  auto a = fake::addr('a');
  db.upsert(row("100", a, "x"));

  CHECK(db.remove("100", "x", "x"));
  db.advance_checkpoint("100", a, {"H1", 1100});
  CHECK_FALSE(db.find("100", a).has_value());
  CHECK(db.count() == 0);
}

TEST_CASE("advance_checkpoint ignores older checkpoints")
{
  Database db(":memory:");
  db.init_schema();
  auto a = fake::addr('a');
  db.upsert(row("100", a, "x", {"H5", 5000}));

  db.advance_checkpoint("100", a, {"H1", 1100});
  CHECK(db.find("100", a)->checkpoint == Checkpoint{"H5", 5000});

  db.advance_checkpoint("100", a, {"H6", 5000});
  CHECK(db.find("100", a)->checkpoint == Checkpoint{"H6", 5000});
}

TEST_CASE("rows survive a restart")
{
  auto path = (std::filesystem::temp_directory_path() /
               ("kaiawatch_test_" + std::to_string(getpid()) + ".db"))
                  .string();
  auto a = fake::addr('a');
  {
    Database db(path);
    CHECK(db.try_instance_lock());
    db.init_schema();
    db.upsert(row("100", a, "cold wallet"));
    db.advance_checkpoint("100", a, {"H1", 1100});
  }
  {
    Database db(path);
    db.init_schema();
    auto found = db.find("100", a);
    REQUIRE(found.has_value());
    CHECK(found->checkpoint == Checkpoint{"H1", 1100});
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + ".wal");
  std::filesystem::remove(path + ".lock");
}
