/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCE_LEDGER_HPP
#define RESOURCE_LEDGER_HPP

#include "managers/ConstructionCatalog.hpp"
#include <string>

namespace Driftwood {

/**
 * @brief Contract for whatever holds the actor's building materials
 *
 * The construction code never inspects the concrete inventory type; it only
 * talks through these three calls. refund() is the rollback path used when a
 * multi-resource deduction fails part way.
 */
class ResourceLedger {
public:
  virtual ~ResourceLedger() = default;

  virtual int query(const std::string &resourceId) const = 0;
  virtual bool tryDeduct(const std::string &resourceId, int amount) = 0;
  virtual void refund(const std::string &resourceId, int amount) = 0;
};

/**
 * @brief True when every entry of cost is covered. A null ledger affords nothing.
 */
bool canAfford(const ResourceLedger *ledger, const ResourceCost &cost);

/**
 * @brief All-or-nothing deduction of a full cost
 *
 * Checks every entry first, then deducts each. If any tryDeduct still fails
 * the entries already taken are refunded, so callers never observe a partial
 * deduction.
 */
bool deductAll(ResourceLedger *ledger, const ResourceCost &cost);

} // namespace Driftwood

#endif // RESOURCE_LEDGER_HPP
