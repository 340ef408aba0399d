#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace quantcore {
namespace marketmaking {

// Market-making position for one symbol. Positive inventory is long.
struct InventoryState {
    std::string symbol;
    Timestamp timestamp;
    double current_inventory;
    double max_inventory;
    double target_inventory;
    std::optional<double> current_price;
    std::optional<double> average_entry_price;
    double realized_pnl;

    InventoryState()
        : timestamp(0)
        , current_inventory(0.0)
        , max_inventory(1.0)
        , target_inventory(0.0)
        , realized_pnl(0.0)
    {}

    InventoryState(std::string sym, double inventory, double max_inv, double target = 0.0)
        : symbol(std::move(sym))
        , timestamp(0)
        , current_inventory(inventory)
        , max_inventory(max_inv)
        , target_inventory(target)
        , realized_pnl(0.0)
    {}

    // -1.0 ~ +1.0 of max
    double inventoryPercent() const {
        return max_inventory > 0.0 ? current_inventory / max_inventory : 0.0;
    }
    double distanceFromTarget() const { return current_inventory - target_inventory; }
    double absoluteInventory() const;
    int direction() const;

    bool isNearLimit() const;      // >= 90% of max
    bool isAtLimit() const;
    bool isNeutral() const;        // within 5% of max
    double availableCapacity() const;

    std::optional<double> unrealizedPnL() const;
    std::optional<double> totalPnL() const;

    // 0 ~ 100: utilization * 0.7 + target distance * 0.3
    int riskLevel() const;
    // Low / Medium / High / Critical
    std::string riskCategory() const;

    bool canIncreaseLong(double quantity) const;
    bool canIncreaseShort(double quantity) const;
    bool shouldReducePosition() const;

    // Signed fill (buy > 0). Updates average entry and realized PnL.
    void applyFill(double signed_quantity, double price, Timestamp ts);

    std::string toString() const;
};

} // namespace marketmaking
} // namespace quantcore
