#include "track/tracker.hpp"

#include <doctest/doctest.h>

#include "core/database.hpp"
#include "fakes.hpp"

namespace {

struct TrackerFixture {
  TrackerFixture() : db(":memory:"), store(db), tracker(store, feed, [] { return int64_t{5000}; }) {
    db.init_schema();
  }

  Database db;
  fake::FlakyStore store;
  fake::Feed feed;
  Tracker tracker;
};

} // namespace

TEST_CASE_FIXTURE(TrackerFixture, "track seeds the checkpoint from the latest transaction")
{
  auto a = fake::addr('a');
  feed.push(a, fake::tx("H0", 1000));

  auto result = tracker.track("100", a, std::string("cold wallet"));
  REQUIRE(result.ok());

  auto row = db.find("100", a);
  REQUIRE(row.has_value());
  CHECK(row->label == "cold wallet");
  CHECK(row->checkpoint == Checkpoint{"H0", 1000});
  CHECK(row->created_at == 5000);
}

TEST_CASE_FIXTURE(TrackerFixture, "track normalizes the address and defaults the label")
{
  std::string mixed = "0x" + std::string(20, 'A') + std::string(20, 'b');
  auto result = tracker.track("100", mixed);
  REQUIRE(result.ok());

  std::string lower = "0x" + std::string(20, 'a') + std::string(20, 'b');
  CHECK(result.row.address == lower);
  CHECK(result.row.label == lower);
  CHECK(db.find("100", lower).has_value());
}

TEST_CASE_FIXTURE(TrackerFixture, "track rejects malformed addresses")
{
  std::vector<std::string> bad_inputs = {"", "0x123", "1x" + std::string(40, 'a'),
                                         "0x" + std::string(39, 'a') + "g",
                                         "0x" + std::string(41, 'a')};
  for (const auto &bad : bad_inputs) {
    auto result = tracker.track("100", bad);
    CHECK(result.status == TrackStatus::InvalidAddress);
  }
  CHECK(db.count() == 0);
}

TEST_CASE_FIXTURE(TrackerFixture, "feed failure seeds the sentinel and the current time")
{
  auto a = fake::addr('a');
  feed.failing.insert(a);

  REQUIRE(tracker.track("100", a).ok());
  auto row = db.find("100", a);
  REQUIRE(row.has_value());
  CHECK(row->checkpoint.is_sentinel());
  CHECK(row->checkpoint.time == 5000);
}

TEST_CASE_FIXTURE(TrackerFixture, "address without history seeds the sentinel")
{
  auto a = fake::addr('a');
  REQUIRE(tracker.track("100", a).ok());
  CHECK(db.find("100", a)->checkpoint == Checkpoint{NO_TRANSACTION_YET, 5000});
}

TEST_CASE_FIXTURE(TrackerFixture, "re-tracking resets the baseline")
{
  auto a = fake::addr('a');
  feed.push(a, fake::tx("H0", 1000));
  auto first = tracker.track("100", a, std::string("old"));
  REQUIRE(first.ok());
  CHECK_FALSE(first.retracked);

  feed.push(a, fake::tx("H1", 1100));
  feed.push(a, fake::tx("H2", 1200));
  auto second = tracker.track("100", a, std::string("new"));
  REQUIRE(second.ok());
  CHECK(second.retracked);
  CHECK_FALSE(tracker.track("200", a).retracked);

  auto row = db.find("100", a);
  CHECK(row->label == "new");
  CHECK(row->checkpoint == Checkpoint{"H2", 1200});
  CHECK(db.count() == 2);
}

TEST_CASE_FIXTURE(TrackerFixture, "lookup failure during track is a store failure")
{
  store.fail_find = true;
  auto result = tracker.track("100", fake::addr('a'));
  CHECK(result.status == TrackStatus::StoreFailure);
  CHECK(db.count() == 0);
}

TEST_CASE_FIXTURE(TrackerFixture, "untrack accepts the address in any case")
{
  std::string checksummed = "0x5EDA3F9AB84DC831AA3C811AF73F54C4CA9EC5AA";
  REQUIRE(tracker.track("100", checksummed, std::string("cold wallet")).ok());

  CHECK(tracker.untrack("100", checksummed));
  CHECK(db.count() == 0);

  REQUIRE(tracker.track("100", checksummed).ok());
  CHECK(tracker.untrack("100", "0x5eda3f9ab84dc831aa3c811af73f54c4ca9ec5aa"));
  CHECK(db.count() == 0);
}

TEST_CASE_FIXTURE(TrackerFixture, "labels still match exactly")
{
  auto a = fake::addr('a');
  REQUIRE(tracker.track("100", a, std::string("Cold Wallet")).ok());
  CHECK_FALSE(tracker.untrack("100", "cold wallet"));
  CHECK_FALSE(tracker.untrack("100", "Cold"));
  CHECK(tracker.untrack("100", "Cold Wallet"));
}

TEST_CASE_FIXTURE(TrackerFixture, "store failures are reported to the caller")
{
  auto a = fake::addr('a');
  store.fail_upsert = true;
  auto result = tracker.track("100", a);
  CHECK(result.status == TrackStatus::StoreFailure);
  CHECK_FALSE(result.error.empty());

  store.fail_upsert = false;
  REQUIRE(tracker.track("100", a, std::string("x")).ok());
  store.fail_remove = true;
  CHECK_FALSE(tracker.untrack("100", "x"));
  CHECK(db.find("100", a).has_value());

  store.fail_list = true;
  CHECK_THROWS_AS(tracker.list("100"), StoreFailure);
}

TEST_CASE_FIXTURE(TrackerFixture, "untrack by label removes the row from list")
{
  auto a = fake::addr('a');
  auto b = fake::addr('b');
  REQUIRE(tracker.track("100", a, std::string("myLabel")).ok());
  REQUIRE(tracker.track("100", b).ok());

  CHECK(tracker.untrack("100", "myLabel"));
  auto entries = tracker.list("100");
  REQUIRE(entries.size() == 1);
  CHECK(entries[0].address == b);
  CHECK_FALSE(tracker.untrack("100", "myLabel"));
}
