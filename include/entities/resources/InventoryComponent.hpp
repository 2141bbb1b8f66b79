/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INVENTORY_COMPONENT_HPP
#define INVENTORY_COMPONENT_HPP

#include "entities/resources/ResourceLedger.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Material inventory carried by a builder (the concrete ResourceLedger)
 *
 * Quantities are keyed by resource id ("plank", "rope", ...). Each distinct
 * resource id takes one slot; maxSlots bounds how many kinds can be held.
 */
class InventoryComponent : public Driftwood::ResourceLedger {
public:
  using ResourceChangeCallback =
      std::function<void(const std::string &, int, int)>;

  explicit InventoryComponent(size_t maxSlots = 50);
  ~InventoryComponent() override = default;

  bool addResource(const std::string &resourceId, int quantity);
  bool removeResource(const std::string &resourceId, int quantity);
  int getResourceQuantity(const std::string &resourceId) const;
  bool hasResource(const std::string &resourceId,
                   int minimumQuantity = 1) const;

  // ResourceLedger
  int query(const std::string &resourceId) const override {
    return getResourceQuantity(resourceId);
  }
  bool tryDeduct(const std::string &resourceId, int amount) override {
    return removeResource(resourceId, amount);
  }
  void refund(const std::string &resourceId, int amount) override;

  void clearInventory();
  size_t getUsedSlots() const;
  size_t getMaxSlots() const { return m_maxSlots; }
  bool isFull() const;
  bool isEmpty() const;

  // Safe quantity limits and validation
  static constexpr int MAX_SAFE_QUANTITY = 1000000;
  static constexpr int MIN_SAFE_QUANTITY = 0;
  bool isValidQuantity(int quantity) const;
  bool wouldOverflow(int currentQuantity, int addQuantity) const;
  bool wouldUnderflow(int currentQuantity, int removeQuantity) const;

  std::unordered_map<std::string, int> getAllResources() const;
  std::vector<std::string> getResourceIds() const;

  bool transferTo(InventoryComponent &target, const std::string &resourceId,
                  int quantity);

  /**
   * @brief Change notification (resourceId, oldQuantity, newQuantity)
   *
   * Invoked outside the inventory lock. Callbacks must not call back into
   * this inventory.
   */
  void setResourceChangeCallback(ResourceChangeCallback callback) {
    m_onResourceChanged = std::move(callback);
  }
  void clearResourceChangeCallback() { m_onResourceChanged = nullptr; }

private:
  std::unordered_map<std::string, int> m_quantities;
  size_t m_maxSlots;
  ResourceChangeCallback m_onResourceChanged;
  mutable std::mutex m_inventoryMutex;

  int getResourceQuantityUnlocked(const std::string &resourceId) const;
  void notifyResourceChangeSafe(const std::string &resourceId, int oldQuantity,
                                int newQuantity);
};

#endif // INVENTORY_COMPONENT_HPP
