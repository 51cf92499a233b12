#include <gtest/gtest.h>
#include <ferry/custody/collateral_custody.hpp>
#include <ferry/custody/synthetic_custody.hpp>
#include <ferry/custody/token_ledger.hpp>
#include <ferry/schema/key/router_keys.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/testing/common.hpp>

#include <string>

namespace {

using storage_t =
    ferry::storage::storage<ferry::storage::rocksdb_storage_tag>;
using ferry::schema::transaction_error_code;

class custody_test : public ::testing::Test {
 protected:
  custody_test()
      : db_path_{ferry::testing::make_db_path("ferry_custody")},
        storage_{ferry::storage::make_storage<
            ferry::storage::rocksdb_storage_tag>(db_path_)} {}

  ~custody_test() override {
    storage_.database.reset();
    ferry::testing::remove_path(db_path_);
  }

  void seed(const ferry::schema::address_t& owner,
            const ferry::schema::token_id_t& token_id,
            const std::string& uri = "ipfs://seed") {
    auto state = ferry::custody::state_t{storage_};
    ASSERT_FALSE(
        ferry::custody::token_ledger::mint(state, owner, token_id, uri));
    state.commit();
  }

  std::optional<ferry::schema::token_record_t> committed(
      const ferry::schema::token_id_t& token_id) {
    auto state = ferry::custody::state_t{storage_};
    return ferry::custody::token_ledger::find(state, token_id);
  }

  std::string db_path_;
  storage_t storage_;
  ferry::schema::address_t alice_{ferry::testing::make_address(1)};
  ferry::schema::address_t bob_{ferry::testing::make_address(40)};
  ferry::schema::address_t escrow_{ferry::testing::make_address(80)};
};

}  // namespace

TEST_F(custody_test, mint_rejects_zero_owner_and_duplicates) {
  auto state = ferry::custody::state_t{storage_};
  EXPECT_EQ(ferry::custody::token_ledger::mint(
                state, ferry::schema::make_zero_address(), 1, ""),
            transaction_error_code::invalid_recipient);
  EXPECT_FALSE(ferry::custody::token_ledger::mint(state, alice_, 1, "a"));
  EXPECT_EQ(ferry::custody::token_ledger::mint(state, bob_, 1, "b"),
            transaction_error_code::token_exists);

  auto record = ferry::custody::token_ledger::find(state, 1);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, alice_);
  EXPECT_EQ(record->token_uri, "a");
  EXPECT_EQ(record->approved, ferry::schema::make_zero_address());
}

TEST_F(custody_test, approve_requires_owner) {
  seed(alice_, 5);
  auto state = ferry::custody::state_t{storage_};
  EXPECT_EQ(ferry::custody::token_ledger::approve(state, bob_, 5, bob_),
            transaction_error_code::not_token_owner);
  EXPECT_EQ(ferry::custody::token_ledger::approve(state, alice_, 6, bob_),
            transaction_error_code::token_missing);
  EXPECT_FALSE(ferry::custody::token_ledger::approve(state, alice_, 5, bob_));

  auto record = ferry::custody::token_ledger::find(state, 5);
  ASSERT_TRUE(record.has_value());
  EXPECT_TRUE(ferry::custody::token_ledger::is_approved_or_owner(*record, bob_));
  EXPECT_FALSE(ferry::custody::token_ledger::is_approved_or_owner(
      *record, ferry::schema::make_zero_address()));
}

TEST_F(custody_test, synthetic_debit_burns_owned_token) {
  seed(alice_, 7);
  auto custody = ferry::custody::synthetic_custody{};

  auto state = ferry::custody::state_t{storage_};
  EXPECT_EQ(custody.debit(state, bob_, 7),
            transaction_error_code::not_token_owner);
  EXPECT_EQ(custody.debit(state, alice_, 8),
            transaction_error_code::token_missing);
  EXPECT_EQ(state.pending_writes(), 0u);

  EXPECT_FALSE(custody.debit(state, alice_, 7));
  EXPECT_FALSE(ferry::custody::token_ledger::find(state, 7).has_value());
  EXPECT_TRUE(committed(7).has_value());

  state.commit();
  EXPECT_FALSE(committed(7).has_value());
}

TEST_F(custody_test, synthetic_debit_accepts_approved_spender) {
  seed(alice_, 7);
  {
    auto state = ferry::custody::state_t{storage_};
    ASSERT_FALSE(ferry::custody::token_ledger::approve(state, alice_, 7, bob_));
    state.commit();
  }
  auto custody = ferry::custody::synthetic_custody{};
  auto state = ferry::custody::state_t{storage_};
  EXPECT_FALSE(custody.debit(state, bob_, 7));
}

TEST_F(custody_test, synthetic_credit_mints_with_uri) {
  auto custody = ferry::custody::synthetic_custody{};
  auto state = ferry::custody::state_t{storage_};
  EXPECT_FALSE(custody.credit(state, bob_, 42, "ipfs://Qm123"));
  EXPECT_EQ(custody.credit(state, alice_, 42, "ipfs://other"),
            transaction_error_code::token_exists);
  EXPECT_EQ(custody.credit(state, ferry::schema::make_zero_address(), 43, ""),
            transaction_error_code::invalid_recipient);
  state.commit();

  auto record = committed(42);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, bob_);
  EXPECT_EQ(record->token_uri, "ipfs://Qm123");
}

TEST_F(custody_test, collateral_debit_locks_into_escrow) {
  seed(alice_, 9);
  {
    auto state = ferry::custody::state_t{storage_};
    ASSERT_FALSE(ferry::custody::token_ledger::approve(state, alice_, 9, bob_));
    state.commit();
  }
  auto custody = ferry::custody::collateral_custody{escrow_};
  EXPECT_EQ(custody.escrow(), escrow_);

  auto state = ferry::custody::state_t{storage_};
  EXPECT_FALSE(custody.debit(state, alice_, 9));
  state.commit();

  auto record = committed(9);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, escrow_);
  EXPECT_EQ(record->approved, ferry::schema::make_zero_address());
  EXPECT_EQ(record->token_uri, "ipfs://seed");

  auto again = ferry::custody::state_t{storage_};
  EXPECT_EQ(custody.debit(again, escrow_, 9),
            transaction_error_code::not_token_owner);
  EXPECT_EQ(custody.debit(again, alice_, 9),
            transaction_error_code::not_token_owner);
  EXPECT_EQ(custody.debit(again, alice_, 10),
            transaction_error_code::token_missing);
}

TEST_F(custody_test, collateral_credit_releases_escrowed_token_only) {
  seed(alice_, 11);
  seed(escrow_, 12, "ipfs://home");
  auto custody = ferry::custody::collateral_custody{escrow_};

  auto state = ferry::custody::state_t{storage_};
  EXPECT_EQ(custody.credit(state, bob_, 11, ""),
            transaction_error_code::token_not_escrowed);
  EXPECT_EQ(custody.credit(state, bob_, 99, ""),
            transaction_error_code::token_not_escrowed);
  EXPECT_EQ(custody.credit(state, ferry::schema::make_zero_address(), 12, ""),
            transaction_error_code::invalid_recipient);
  EXPECT_FALSE(custody.credit(state, bob_, 12, "ipfs://ignored"));
  state.commit();

  auto record = committed(12);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, bob_);
  EXPECT_EQ(record->token_uri, "ipfs://home");
}

TEST_F(custody_test, ledger_rows_live_under_token_prefix) {
  seed(alice_, 1);
  seed(alice_, 2);
  auto prefix = ferry::schema::make_bytes(ferry::schema::key::kTokenKeyPrefix);
  auto rows = storage_.list_by_prefix(
      ferry::schema::bytes_view_t{prefix.data(), prefix.size()});
  EXPECT_EQ(rows.size(), 2u);
}
