#include "mqm_collector/intermediate_row.h"
#include "mqm_collector/record_assembler.h"

#include <gtest/gtest.h>

namespace mqm_collector {

TEST(RecordAssemblerTest, ListenerRecord) {
    RecordAssembler assembler(StatusKind::Listener);
    auto records = assembler.assemble({encode_row({"QM1", "2", "L1,L2"})});

    ASSERT_EQ(records.size(), 1u);
    const auto& rec = std::get<ListenerStatus>(records[0]);
    EXPECT_EQ(rec.manager_name, "QM1");
    EXPECT_EQ(rec.count, 2u);
    EXPECT_EQ(rec.listener_names, (std::vector<std::string>{"L1", "L2"}));
    EXPECT_FALSE(rec.invalid);
    EXPECT_EQ(assembler.dropped(), 0u);
}

TEST(RecordAssemblerTest, ListenerCountMustMatchNames) {
    RecordAssembler assembler(StatusKind::Listener);
    auto records = assembler.assemble({encode_row({"QM1", "3", "L1,L2"}),
                                       encode_row({"QM2", "0", ""})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<ListenerStatus>(records[0]).manager_name, "QM2");
    EXPECT_EQ(assembler.dropped(), 1u);
}

TEST(RecordAssemblerTest, DropsMalformedRows) {
    RecordAssembler assembler(StatusKind::DeadLetter);
    auto records = assembler.assemble({
        encode_row({"QM1", "5", "DLQ"}),
        encode_row({"QM2", "five", "DLQ"}),
        encode_row({"QM3", "-2", "DLQ"}),
        encode_row({"QM4", "1"}),
        encode_row({"", "1", "DLQ"}),
    });
    ASSERT_EQ(records.size(), 1u);
    const auto& rec = std::get<DeadLetterQueueStatus>(records[0]);
    EXPECT_EQ(rec.depth, 5);
    EXPECT_EQ(rec.dlq_name, "DLQ");
    EXPECT_EQ(assembler.dropped(), 4u);
}

TEST(RecordAssemblerTest, ManagerStateRange) {
    RecordAssembler assembler(StatusKind::Manager);
    auto records = assembler.assemble({encode_row({"QM1", "2"}), encode_row({"QM2", "3"})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<ManagerStatus>(records[0]).state, manager_state::STANDBY_RUNNING);
    EXPECT_EQ(assembler.dropped(), 1u);
}

TEST(RecordAssemblerTest, InvalidRowsBecomeInvalidRecords) {
    RecordAssembler cs(StatusKind::CommandServer);
    auto records = cs.assemble({encode_row({"bad name", INVALID_TAG})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(std::get<CommandServerStatus>(records[0]).is_invalid());

    RecordAssembler age(StatusKind::OldestMessage);
    records = age.assemble({encode_row({"bad name", INVALID_TAG})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<MessageAgeRecord>(records[0]).queue_name, INVALID_TAG);
    EXPECT_EQ(std::get<MessageAgeRecord>(records[0]).age_seconds, 0u);
}

TEST(RecordAssemblerTest, EmptyNameOnlyOnInvalidRows) {
    RecordAssembler assembler(StatusKind::Listener);
    auto records = assembler.assemble({encode_row({"", INVALID_TAG}),
                                       encode_row({"", "0", ""})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(std::get<ListenerStatus>(records[0]).invalid);
    EXPECT_EQ(std::get<ListenerStatus>(records[0]).manager_name, "");
    EXPECT_EQ(assembler.dropped(), 1u);
}

TEST(RecordAssemblerTest, AgeSentinelWithEmptyQueue) {
    RecordAssembler assembler(StatusKind::OldestMessage);
    auto records = assembler.assemble({encode_row({"QM1", "", "0"})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<MessageAgeRecord>(records[0]).queue_name, "");
    EXPECT_EQ(assembler.dropped(), 0u);
}

TEST(RecordAssemblerTest, NegativeAgeDropped) {
    RecordAssembler assembler(StatusKind::OldestMessage);
    auto records = assembler.assemble({encode_row({"QM1", "Q1", "-4"}),
                                       encode_row({"QM1", "Q2", "12"})});
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(std::get<MessageAgeRecord>(records[0]).age_seconds, 12u);
    EXPECT_EQ(assembler.dropped(), 1u);
}

TEST(IntermediateRowTest, DelimiterStrippedFromValues) {
    auto row = encode_row({"QM1", std::string("L1") + ROW_DELIMITER + "L2", ""});
    EXPECT_EQ(split_row(row), (std::vector<std::string>{"QM1", "L1L2", ""}));
}

} // namespace mqm_collector
