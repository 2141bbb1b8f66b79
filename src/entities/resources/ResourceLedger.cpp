/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/resources/ResourceLedger.hpp"
#include "core/Logger.hpp"
#include <utility>
#include <vector>

namespace Driftwood {

bool canAfford(const ResourceLedger *ledger, const ResourceCost &cost) {
  if (ledger == nullptr) {
    return false;
  }
  for (const auto &[resourceId, amount] : cost) {
    if (ledger->query(resourceId) < amount) {
      return false;
    }
  }
  return true;
}

bool deductAll(ResourceLedger *ledger, const ResourceCost &cost) {
  if (!canAfford(ledger, cost)) {
    return false;
  }

  std::vector<std::pair<std::string, int>> taken;
  taken.reserve(cost.size());

  for (const auto &[resourceId, amount] : cost) {
    if (ledger->tryDeduct(resourceId, amount)) {
      taken.emplace_back(resourceId, amount);
      continue;
    }

    INVENTORY_WARN("deductAll - tryDeduct failed for " + resourceId +
                   ", rolling back " + std::to_string(taken.size()) +
                   " entries");
    for (auto it = taken.rbegin(); it != taken.rend(); ++it) {
      ledger->refund(it->first, it->second);
    }
    return false;
  }
  return true;
}

} // namespace Driftwood
