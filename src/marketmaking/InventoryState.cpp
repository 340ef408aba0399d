#include "marketmaking/InventoryState.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace quantcore {
namespace marketmaking {

double InventoryState::absoluteInventory() const {
    return std::abs(current_inventory);
}

int InventoryState::direction() const {
    if (current_inventory > 0.0) return 1;
    if (current_inventory < 0.0) return -1;
    return 0;
}

bool InventoryState::isNearLimit() const {
    return std::abs(inventoryPercent()) >= 0.9;
}

bool InventoryState::isAtLimit() const {
    return absoluteInventory() >= max_inventory;
}

bool InventoryState::isNeutral() const {
    return std::abs(inventoryPercent()) <= 0.05;
}

double InventoryState::availableCapacity() const {
    return max_inventory - absoluteInventory();
}

std::optional<double> InventoryState::unrealizedPnL() const {
    if (!current_price || !average_entry_price) {
        return std::nullopt;
    }
    return current_inventory * (*current_price - *average_entry_price);
}

std::optional<double> InventoryState::totalPnL() const {
    auto unrealized = unrealizedPnL();
    if (!unrealized) {
        return std::nullopt;
    }
    return realized_pnl + *unrealized;
}

int InventoryState::riskLevel() const {
    double utilization = std::abs(inventoryPercent());
    double distance_pct = max_inventory > 0.0 ? std::abs(distanceFromTarget() / max_inventory) : 0.0;
    double risk = (utilization * 0.7 + distance_pct * 0.3) * 100.0;
    return static_cast<int>(std::clamp(risk, 0.0, 100.0));
}

std::string InventoryState::riskCategory() const {
    int risk = riskLevel();
    if (risk < 30) return "Low";
    if (risk < 60) return "Medium";
    if (risk < 85) return "High";
    return "Critical";
}

bool InventoryState::canIncreaseLong(double quantity) const {
    if (quantity <= 0.0) return false;
    return current_inventory + quantity <= max_inventory;
}

bool InventoryState::canIncreaseShort(double quantity) const {
    if (quantity <= 0.0) return false;
    return std::abs(current_inventory - quantity) <= max_inventory;
}

bool InventoryState::shouldReducePosition() const {
    double utilization = std::abs(inventoryPercent());
    double distance_pct = max_inventory > 0.0 ? std::abs(distanceFromTarget() / max_inventory) : 0.0;
    return utilization > 0.7 || distance_pct > 0.5;
}

void InventoryState::applyFill(double signed_quantity, double price, Timestamp ts) {
    if (signed_quantity == 0.0) {
        return;
    }

    const double held = current_inventory;
    const double avg = average_entry_price.value_or(price);
    const bool same_direction = held == 0.0 || (held > 0.0) == (signed_quantity > 0.0);

    if (same_direction) {
        double total = std::abs(held) + std::abs(signed_quantity);
        average_entry_price = (std::abs(held) * avg + std::abs(signed_quantity) * price) / total;
    } else {
        // Closing part of the position realizes PnL against the average entry
        double closing = std::min(std::abs(signed_quantity), std::abs(held));
        realized_pnl += closing * (price - avg) * (held > 0.0 ? 1.0 : -1.0);

        if (std::abs(signed_quantity) > std::abs(held)) {
            average_entry_price = price;        // flipped
        } else if (std::abs(signed_quantity) == std::abs(held)) {
            average_entry_price.reset();        // flat
        }
    }

    current_inventory = held + signed_quantity;
    current_price = price;
    timestamp = ts;
}

std::string InventoryState::toString() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4)
       << "InventoryState[" << symbol << "]: Pos=" << current_inventory
       << std::setprecision(0) << " (" << inventoryPercent() * 100.0 << "%), Risk="
       << riskCategory() << " (" << riskLevel() << ")";
    if (auto pnl = totalPnL()) {
        ss << std::setprecision(2) << ", PnL=" << *pnl;
    }
    return ss.str();
}

} // namespace marketmaking
} // namespace quantcore
