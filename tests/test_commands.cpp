#include <gtest/gtest.h>

#include "devices/commands.hpp"
#include "devices/slot_layout.hpp"

using namespace vmc;

TEST(CommandBuilder, DeliverPayloadIsSlotAndQuantity)
{
    auto frame = CommandBuilder::deliver(3, 2);
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value().header, Header::HOST);
    EXPECT_EQ(frame.value().command, Protocol::Command::DELIVER);
    EXPECT_EQ(frame.value().payload, (std::vector<uint8_t>{0x03, 0x02}));
}

TEST(CommandBuilder, DeliverRejectsOutOfRangeSlot)
{
    auto low = CommandBuilder::deliver(0);
    ASSERT_FALSE(low.ok());
    EXPECT_EQ(low.error(), Error::ARGUMENT);

    auto high = CommandBuilder::deliver(256);
    ASSERT_FALSE(high.ok());
    EXPECT_EQ(high.error(), Error::ARGUMENT);

    EXPECT_TRUE(CommandBuilder::deliver(255).ok());
}

TEST(CommandBuilder, DeliverRejectsZeroQuantity)
{
    auto frame = CommandBuilder::deliver(5, 0);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error(), Error::ARGUMENT);
}

TEST(CommandBuilder, FixedPayloadCommands)
{
    EXPECT_EQ(CommandBuilder::get_device_id().value().payload, std::vector<uint8_t>{0xAD});
    EXPECT_EQ(CommandBuilder::remove_fault().value().payload, std::vector<uint8_t>{0xFF});
    EXPECT_EQ(CommandBuilder::coin_change().value().payload, std::vector<uint8_t>{0xFF});
    EXPECT_EQ(CommandBuilder::cashless_cancel().value().payload, std::vector<uint8_t>{0xFF});
    EXPECT_EQ(CommandBuilder::query_coin_change_status().value().payload, std::vector<uint8_t>{0x01});
    EXPECT_EQ(CommandBuilder::query_age_verification().value().payload, std::vector<uint8_t>{0x01});
    EXPECT_EQ(CommandBuilder::query_balance().value().payload, (std::vector<uint8_t>{0x00, 0x00, 0x00, 0x00}));
}

TEST(CommandBuilder, BalanceAndStatusShareCommandCode)
{
    EXPECT_EQ(CommandBuilder::query_balance().value().command, 0xE1);
    EXPECT_EQ(CommandBuilder::query_status(12).value().command, 0xE1);
}

TEST(CommandBuilder, PaymentInstructionLayout)
{
    auto frame = CommandBuilder::payment_instruction(1000, PaymentMethod::CASHLESS, 21);
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value().command, Protocol::Command::PAYMENT_INSTRUCTION);
    EXPECT_EQ(frame.value().payload, (std::vector<uint8_t>{0xE8, 0x03, 0x00, 0x00, 0x02, 0x15}));
}

TEST(CommandBuilder, PaymentInstructionRejectsNegativeAmount)
{
    auto frame = CommandBuilder::payment_instruction(-1, PaymentMethod::COIN, 1);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error(), Error::ARGUMENT);
}

TEST(CommandBuilder, PaymentInstructionRejectsAmountAbove32Bits)
{
    auto frame = CommandBuilder::payment_instruction(0x100000000LL, PaymentMethod::COIN, 1);
    ASSERT_FALSE(frame.ok());
    EXPECT_EQ(frame.error(), Error::ARGUMENT);
}

TEST(CommandBuilder, DebitInstructionIsLittleEndian)
{
    auto frame = CommandBuilder::debit_instruction(0x01020304);
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value().payload, (std::vector<uint8_t>{0x04, 0x03, 0x02, 0x01}));
}

TEST(CommandBuilder, AgeRecognitionBounds)
{
    EXPECT_EQ(CommandBuilder::age_recognition(0).error(), Error::ARGUMENT);
    EXPECT_EQ(CommandBuilder::age_recognition(100).error(), Error::ARGUMENT);

    auto frame = CommandBuilder::age_recognition(18);
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value().payload, std::vector<uint8_t>{18});
}

TEST(SlotLayout, AcceptsOnlyWiredSlots)
{
    EXPECT_TRUE(SlotLayout::is_valid_slot(1));
    EXPECT_TRUE(SlotLayout::is_valid_slot(8));
    EXPECT_TRUE(SlotLayout::is_valid_slot(11));
    EXPECT_TRUE(SlotLayout::is_valid_slot(58));

    EXPECT_FALSE(SlotLayout::is_valid_slot(0));
    EXPECT_FALSE(SlotLayout::is_valid_slot(9));
    EXPECT_FALSE(SlotLayout::is_valid_slot(10));
    EXPECT_FALSE(SlotLayout::is_valid_slot(59));
    EXPECT_FALSE(SlotLayout::is_valid_slot(61));
}

TEST(SlotLayout, RowsAndColumns)
{
    EXPECT_EQ(SlotLayout::row_of(23), 3);
    EXPECT_EQ(SlotLayout::column_of(23), 3);
    EXPECT_FALSE(SlotLayout::row_of(9).has_value());
    EXPECT_EQ(SlotLayout::all_slots().size(), 48u);
    EXPECT_EQ(SlotLayout::slots_in_row(6).front(), 51);
}
