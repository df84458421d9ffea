#pragma once

#include <optional>
#include <string>
#include <vector>

namespace vmc {

// The VMC drives 48 slots in 6 rows of 8: 1-8, 11-18, 21-28, 31-38, 41-48, 51-58.
class SlotLayout
{
public:
    static constexpr int ROWS = 6;
    static constexpr int SLOTS_PER_ROW = 8;

    static bool is_valid_slot(int slot);
    static std::optional<int> row_of(int slot);
    static std::optional<int> column_of(int slot);
    static std::vector<int> slots_in_row(int row);
    static std::vector<int> all_slots();
    static std::string describe_valid_slots();
};

} // namespace vmc
