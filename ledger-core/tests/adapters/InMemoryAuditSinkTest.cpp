#include <gtest/gtest.h>
#include "adapters/secondary/InMemoryAuditSink.hpp"
#include <type_traits>

using namespace ledger;
using namespace ledger::adapters::secondary;

namespace {

// Приёмник без recordAll() не может дробить пачку по одной записи
struct RecordOnlySink : public ports::output::IAuditSink {
    void record(const domain::AuditRecord&) override {}
};
static_assert(std::is_abstract_v<RecordOnlySink>,
              "audit sinks must implement batch recording themselves");

domain::AuditRecord makeRecord(const std::string& entityId, const std::string& action) {
    domain::AuditRecord record;
    record.actorId = "tester";
    record.action = action;
    record.entityType = "JournalEntry";
    record.entityId = entityId;
    record.after = {{"id", entityId}};
    record.timestamp = domain::Timestamp::now();
    return record;
}

} // namespace

TEST(InMemoryAuditSinkTest, BatchKeptInOrder) {
    InMemoryAuditSink sink;
    sink.record(makeRecord("je-1", "CREATE"));
    sink.recordAll({makeRecord("je-2", "CREATE"), makeRecord("je-2", "STATUS_CHANGE")});

    auto records = sink.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].entityId, "je-1");
    EXPECT_EQ(records[1].action, "CREATE");
    EXPECT_EQ(records[2].action, "STATUS_CHANGE");
    EXPECT_EQ(records[2].after["id"], "je-2");
}

TEST(InMemoryAuditSinkTest, EmptyBatchIsNoop) {
    InMemoryAuditSink sink;
    sink.recordAll({});
    EXPECT_EQ(sink.size(), 0u);
}
