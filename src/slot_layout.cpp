#include "devices/slot_layout.hpp"

namespace vmc {

bool SlotLayout::is_valid_slot(int slot)
{
    if (slot < 1) return false;
    int row = slot / 10;
    int col = slot % 10;
    return row < ROWS && col >= 1 && col <= SLOTS_PER_ROW;
}

std::optional<int> SlotLayout::row_of(int slot)
{
    if (!is_valid_slot(slot)) return std::nullopt;
    return slot / 10 + 1;
}

std::optional<int> SlotLayout::column_of(int slot)
{
    if (!is_valid_slot(slot)) return std::nullopt;
    return slot % 10;
}

std::vector<int> SlotLayout::slots_in_row(int row)
{
    std::vector<int> slots;
    if (row < 1 || row > ROWS) return slots;
    for (int col = 1; col <= SLOTS_PER_ROW; ++col) {
        slots.push_back((row - 1) * 10 + col);
    }
    return slots;
}

std::vector<int> SlotLayout::all_slots()
{
    std::vector<int> slots;
    for (int row = 1; row <= ROWS; ++row) {
        auto in_row = slots_in_row(row);
        slots.insert(slots.end(), in_row.begin(), in_row.end());
    }
    return slots;
}

std::string SlotLayout::describe_valid_slots()
{
    return "Valid slots are: 1-8, 11-18, 21-28, 31-38, 41-48, 51-58";
}

} // namespace vmc
