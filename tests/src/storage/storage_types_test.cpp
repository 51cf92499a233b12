#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/storage/pending_state.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/storage/storage.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <tuple>

namespace {

using storage_t = ferry::storage::storage<ferry::storage::rocksdb_storage_tag>;
using state_t =
    ferry::storage::pending_state<ferry::storage::rocksdb_storage_tag>;
using encoder_t = ferry::schema::encoding::encoder<
    ferry::schema::encoding::scale_encoder_tag>;

ferry::schema::bytes_view_t view_of(const ferry::schema::bytes_t& bytes) {
  return ferry::schema::bytes_view_t{bytes.data(), bytes.size()};
}

class storage_types_test : public ::testing::Test {
 protected:
  storage_types_test()
      : db_path_{ferry::testing::make_db_path("ferry_storage")},
        storage_{ferry::storage::make_storage<
            ferry::storage::rocksdb_storage_tag>(db_path_)} {}

  ~storage_types_test() override {
    storage_.database.reset();
    ferry::testing::remove_path(db_path_);
  }

  std::string db_path_;
  storage_t storage_;
};

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = ferry::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());

  auto write = ferry::storage::write_entry_t{};
  EXPECT_FALSE(write.second.has_value());
}

TEST_F(storage_types_test, encoded_values_round_trip) {
  auto encoder = encoder_t{};
  auto key = ferry::schema::make_bytes(std::string_view{"K|1"});
  auto value = std::tuple<uint16_t, std::string>{1, "ipfs://Qm123"};
  storage_.put(encoder, view_of(key), value);

  auto loaded = storage_.get<decltype(value)>(encoder, view_of(key));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, value);

  auto missing = ferry::schema::make_bytes(std::string_view{"K|2"});
  EXPECT_FALSE(
      storage_.get<decltype(value)>(encoder, view_of(missing)).has_value());
  EXPECT_FALSE(storage_.get_raw(view_of(missing)).has_value());
}

TEST_F(storage_types_test, try_decode_rejects_truncated_rows) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple<uint16_t, uint64_t>{1, 99});
  encoded.resize(3);
  EXPECT_FALSE(
      encoder.try_decode<std::tuple<uint16_t, uint64_t>>(view_of(encoded)));
}

TEST_F(storage_types_test, write_applies_puts_and_deletes_together) {
  auto a = ferry::schema::make_bytes(std::string_view{"P|a"});
  auto b = ferry::schema::make_bytes(std::string_view{"P|b"});
  storage_.write({{a, ferry::schema::bytes_t{1}}, {b, ferry::schema::bytes_t{2}}});
  storage_.write({{a, std::nullopt}, {b, ferry::schema::bytes_t{3}}});

  EXPECT_FALSE(storage_.get_raw(view_of(a)).has_value());
  EXPECT_EQ(storage_.get_raw(view_of(b)), ferry::schema::bytes_t{3});
}

TEST_F(storage_types_test, list_by_prefix_stays_in_keyspace) {
  storage_.write(
      {{ferry::schema::make_bytes(std::string_view{"A|2"}), ferry::schema::bytes_t{2}},
       {ferry::schema::make_bytes(std::string_view{"A|1"}), ferry::schema::bytes_t{1}},
       {ferry::schema::make_bytes(std::string_view{"B|1"}), ferry::schema::bytes_t{9}}});

  auto prefix = ferry::schema::make_bytes(std::string_view{"A|"});
  auto rows = storage_.list_by_prefix(view_of(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(ferry::schema::make_string(rows[0].first), "A|1");
  EXPECT_EQ(ferry::schema::make_string(rows[1].first), "A|2");
}

TEST_F(storage_types_test, pending_state_reads_its_own_writes) {
  auto key = ferry::schema::make_bytes(std::string_view{"S|1"});
  storage_.write({{key, ferry::schema::bytes_t{1}}});

  auto state = state_t{storage_};
  EXPECT_EQ(state.get(view_of(key)), ferry::schema::bytes_t{1});
  state.put(view_of(key), ferry::schema::bytes_t{2});
  EXPECT_EQ(state.get(view_of(key)), ferry::schema::bytes_t{2});
  state.erase(view_of(key));
  EXPECT_FALSE(state.get(view_of(key)).has_value());
  EXPECT_EQ(state.pending_writes(), 1u);

  EXPECT_EQ(storage_.get_raw(view_of(key)), ferry::schema::bytes_t{1});
}

TEST_F(storage_types_test, uncommitted_pending_state_is_discarded) {
  auto key = ferry::schema::make_bytes(std::string_view{"S|2"});
  {
    auto state = state_t{storage_};
    state.put(view_of(key), ferry::schema::bytes_t{7});
  }
  EXPECT_FALSE(storage_.get_raw(view_of(key)).has_value());

  auto state = state_t{storage_};
  state.put(view_of(key), ferry::schema::bytes_t{7});
  state.discard();
  state.commit();
  EXPECT_FALSE(storage_.get_raw(view_of(key)).has_value());
}

TEST_F(storage_types_test, pending_state_commit_is_atomic_batch) {
  auto encoder = encoder_t{};
  auto a = ferry::schema::make_bytes(std::string_view{"C|a"});
  auto b = ferry::schema::make_bytes(std::string_view{"C|b"});
  storage_.write({{b, ferry::schema::bytes_t{5}}});

  auto state = state_t{storage_};
  state.put(encoder, view_of(a), std::string{"locked"});
  state.erase(view_of(b));
  state.commit();
  EXPECT_EQ(state.pending_writes(), 0u);

  auto loaded = storage_.get<std::string>(encoder, view_of(a));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, "locked");
  EXPECT_EQ(state.get<std::string>(encoder, view_of(a)), "locked");
  EXPECT_FALSE(storage_.get_raw(view_of(b)).has_value());
}
