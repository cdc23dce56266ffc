#include "synccore/transaction/handler.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <string>

using synccore::ErrorCode;
using synccore::transaction::InMemoryTransactionStore;
using synccore::transaction::StepRow;
using synccore::transaction::SyncEvent;
using synccore::transaction::SyncTransactionHandler;
using synccore::transaction::TransactionRow;
using synccore::transaction::TransactionStatus;

namespace {

SyncEvent make_event(const std::string& transaction_id = "tx-1") {
    SyncEvent event;
    if (!transaction_id.empty()) {
        event.transaction_id = transaction_id;
    }
    event.entity_type = "course";
    event.entity_id = "101";
    event.operation = "update";
    event.source_system = "desktop";
    event.target_system = "server";
    event.timestamp = synccore::timestamp_from_millis(1700000000000);
    event.data = nlohmann::json{{"title", "Algebra"}};
    return event;
}

// Store whose writes can be switched off to observe error propagation
class FailingStore : public InMemoryTransactionStore {
public:
    bool fail_transactions = false;
    bool fail_steps = false;

    synccore::Result<void> insert_transaction(const TransactionRow& row) override {
        if (fail_transactions) {
            return synccore::Err<void>(synccore::Error{ErrorCode::Storage, "disk full"});
        }
        return InMemoryTransactionStore::insert_transaction(row);
    }

    synccore::Result<void> update_transaction(const TransactionRow& row) override {
        if (fail_transactions) {
            return synccore::Err<void>(synccore::Error{ErrorCode::Storage, "disk full"});
        }
        return InMemoryTransactionStore::update_transaction(row);
    }

    synccore::Result<void> insert_step(const StepRow& row) override {
        if (fail_steps) {
            return synccore::Err<void>(synccore::Error{ErrorCode::Storage, "disk full"});
        }
        return InMemoryTransactionStore::insert_step(row);
    }
};

} // namespace

TEST(SyncTransactionHandlerTest, CommitLifecycle) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);
    EXPECT_EQ(handler.status(), TransactionStatus::Pending);

    ASSERT_TRUE(handler.begin().is_ok());
    EXPECT_EQ(handler.status(), TransactionStatus::InProgress);
    ASSERT_TRUE(handler.record_step("validate", nlohmann::json{{"ok", true}}).is_ok());
    ASSERT_TRUE(handler.record_step("apply").is_ok());
    ASSERT_TRUE(handler.commit().is_ok());
    EXPECT_EQ(handler.status(), TransactionStatus::Completed);

    auto loaded = SyncTransactionHandler::get_by_id(store, "tx-1");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
    const auto& tx = loaded.value();
    EXPECT_EQ(tx.status, TransactionStatus::Completed);
    EXPECT_EQ(tx.entity_type, "course");
    EXPECT_EQ(tx.operation, "update");
    EXPECT_EQ(tx.source_system, "desktop");
    EXPECT_EQ(tx.target_system, "server");
    ASSERT_TRUE(tx.end_time.has_value());
    EXPECT_GE(*tx.end_time, tx.start_time);
    ASSERT_TRUE(tx.duration_ms.has_value());
    EXPECT_GE(*tx.duration_ms, 0);
    EXPECT_FALSE(tx.error_message.has_value());

    ASSERT_EQ(tx.steps.size(), 2u);
    EXPECT_EQ(tx.steps[0].description, "validate");
    EXPECT_EQ(tx.steps[0].data, (nlohmann::json{{"ok", true}}));
    EXPECT_EQ(tx.steps[1].description, "apply");
    EXPECT_EQ(tx.steps[1].data, nlohmann::json::object());
}

TEST(SyncTransactionHandlerTest, RollbackRecordsReasonAndStep) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);

    ASSERT_TRUE(handler.begin().is_ok());
    ASSERT_TRUE(handler.record_step("upload").is_ok());
    ASSERT_TRUE(handler.rollback("network lost").is_ok());
    EXPECT_EQ(handler.status(), TransactionStatus::RolledBack);

    auto loaded = SyncTransactionHandler::get_by_id(store, "tx-1");
    ASSERT_TRUE(loaded.is_ok());
    const auto& tx = loaded.value();
    EXPECT_EQ(tx.status, TransactionStatus::RolledBack);
    EXPECT_EQ(tx.error_message, std::optional<std::string>("network lost"));
    EXPECT_TRUE(tx.duration_ms.has_value());

    ASSERT_EQ(tx.steps.size(), 2u);
    EXPECT_EQ(tx.steps[1].description, "Transaction rolled back");
    EXPECT_EQ(tx.steps[1].data, (nlohmann::json{{"error", "network lost"}}));
}

TEST(SyncTransactionHandlerTest, FailRecordsReasonAndStep) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);

    ASSERT_TRUE(handler.begin().is_ok());
    ASSERT_TRUE(handler.fail("checksum mismatch").is_ok());
    EXPECT_EQ(handler.status(), TransactionStatus::Failed);

    auto loaded = SyncTransactionHandler::get_by_id(store, "tx-1");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().status, TransactionStatus::Failed);
    EXPECT_EQ(loaded.value().error_message, std::optional<std::string>("checksum mismatch"));
    ASSERT_EQ(loaded.value().steps.size(), 1u);
    EXPECT_EQ(loaded.value().steps[0].description, "Transaction failed");
}

TEST(SyncTransactionHandlerTest, RejectsInvalidTransitions) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);

    auto early_commit = handler.commit();
    ASSERT_TRUE(early_commit.is_error());
    EXPECT_EQ(early_commit.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(handler.begin().is_ok());
    auto second_begin = handler.begin();
    ASSERT_TRUE(second_begin.is_error());
    EXPECT_EQ(second_begin.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(handler.commit().is_ok());
    EXPECT_TRUE(handler.commit().has_error(ErrorCode::InvalidState));
    EXPECT_TRUE(handler.rollback("late").has_error(ErrorCode::InvalidState));
    EXPECT_TRUE(handler.fail("late").has_error(ErrorCode::InvalidState));
    EXPECT_TRUE(handler.record_step("late").has_error(ErrorCode::InvalidState));
    EXPECT_FALSE(handler.record_step("late").has_error(ErrorCode::Storage));

    EXPECT_EQ(handler.status(), TransactionStatus::Completed);
    EXPECT_EQ(store.step_count(), 0u);
}

TEST(SyncTransactionHandlerTest, RollbackBeforeBeginPersistsTerminalRow) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);

    ASSERT_TRUE(handler.rollback("cancelled").is_ok());
    EXPECT_EQ(store.transaction_count(), 1u);

    auto loaded = SyncTransactionHandler::get_by_id(store, "tx-1");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().status, TransactionStatus::RolledBack);
    EXPECT_EQ(handler.begin().error().code, ErrorCode::InvalidState);
}

TEST(SyncTransactionHandlerTest, UnknownIdIsNotFound) {
    InMemoryTransactionStore store;
    auto loaded = SyncTransactionHandler::get_by_id(store, "missing");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::NotFound);
}

TEST(SyncTransactionHandlerTest, ListRecentNewestFirst) {
    InMemoryTransactionStore store;
    for (const char* id : {"tx-a", "tx-b", "tx-c"}) {
        SyncTransactionHandler handler(make_event(id), store);
        ASSERT_TRUE(handler.begin().is_ok());
    }

    auto recent = SyncTransactionHandler::list_recent(store, 2);
    ASSERT_TRUE(recent.is_ok());
    ASSERT_EQ(recent.value().size(), 2u);
    EXPECT_EQ(recent.value()[0].id, "tx-c");
    EXPECT_EQ(recent.value()[1].id, "tx-b");
    EXPECT_TRUE(recent.value()[0].steps.empty());

    auto none = SyncTransactionHandler::list_recent(store, 0);
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value().empty());
}

TEST(SyncTransactionHandlerTest, StorageFailurePropagatesWithoutStateChange) {
    FailingStore store;
    SyncTransactionHandler handler(make_event(), store);

    store.fail_transactions = true;
    auto begun = handler.begin();
    ASSERT_TRUE(begun.is_error());
    EXPECT_EQ(begun.error().code, ErrorCode::Storage);
    EXPECT_EQ(handler.status(), TransactionStatus::Pending);

    store.fail_transactions = false;
    ASSERT_TRUE(handler.begin().is_ok());

    store.fail_steps = true;
    auto step = handler.record_step("upload");
    ASSERT_TRUE(step.is_error());
    EXPECT_EQ(step.error().code, ErrorCode::Storage);
    EXPECT_TRUE(handler.steps().empty());

    store.fail_transactions = true;
    EXPECT_EQ(handler.commit().error().code, ErrorCode::Storage);
    EXPECT_EQ(handler.status(), TransactionStatus::InProgress);

    store.fail_transactions = false;
    store.fail_steps = false;
    ASSERT_TRUE(handler.commit().is_ok());
}

TEST(SyncTransactionHandlerTest, FailAfterStepErrorFinalisesOnce) {
    FailingStore store;
    SyncTransactionHandler handler(make_event(), store);
    ASSERT_TRUE(handler.begin().is_ok());

    store.fail_steps = true;
    auto step = handler.record_step("Resolved conflicts");
    ASSERT_TRUE(step.has_error(ErrorCode::Storage));

    store.fail_steps = false;
    ASSERT_TRUE(handler.fail(step.error().message).is_ok());
    EXPECT_TRUE(handler.fail("again").has_error(ErrorCode::InvalidState));

    auto loaded = SyncTransactionHandler::get_by_id(store, "tx-1");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().status, TransactionStatus::Failed);
    EXPECT_EQ(loaded.value().error_message, std::optional<std::string>("disk full"));
    ASSERT_EQ(loaded.value().steps.size(), 1u);
    EXPECT_EQ(loaded.value().steps[0].description, "Transaction failed");
}

TEST(SyncTransactionHandlerTest, UnencodableStepDataIsSerializationError) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);
    ASSERT_TRUE(handler.begin().is_ok());

    auto step = handler.record_step("bad", nlohmann::json{{"blob", "\xff"}});
    ASSERT_TRUE(step.is_error());
    EXPECT_EQ(step.error().code, ErrorCode::Serialization);
    EXPECT_EQ(store.step_count(), 0u);
}

TEST(SyncTransactionHandlerTest, EventDataCarriesEntityAndPayload) {
    InMemoryTransactionStore store;
    SyncTransactionHandler handler(make_event(), store);
    ASSERT_TRUE(handler.begin().is_ok());

    auto loaded = SyncTransactionHandler::get_by_id(store, handler.transaction_id());
    ASSERT_TRUE(loaded.is_ok());
    const auto& event_data = loaded.value().event_data;
    EXPECT_EQ(event_data.at("entity_id").get<std::string>(), "101");
    EXPECT_EQ(event_data.at("timestamp").get<std::string>(), "2023-11-14T22:13:20.000000Z");
    EXPECT_EQ(event_data.at("data"), (nlohmann::json{{"title", "Algebra"}}));
}

TEST(SyncTransactionHandlerTest, GeneratesIdsWhenEventHasNone) {
    InMemoryTransactionStore store;
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        SyncTransactionHandler handler(make_event(""), store);
        const auto& id = handler.transaction_id();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 50u);
}
