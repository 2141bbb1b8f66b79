/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/resources/InventoryComponent.hpp"
#include "core/Logger.hpp"
#include <algorithm>

InventoryComponent::InventoryComponent(size_t maxSlots)
    : m_maxSlots(maxSlots) {
  m_quantities.reserve(maxSlots);
}

bool InventoryComponent::addResource(const std::string &resourceId,
                                     int quantity) {
  if (quantity <= 0 || resourceId.empty()) {
    return false;
  }

  if (!isValidQuantity(quantity)) {
    INVENTORY_ERROR("addResource - Invalid quantity: " +
                    std::to_string(quantity) + " for " + resourceId);
    return false;
  }

  int oldQuantity, newQuantity;

  {
    std::lock_guard<std::mutex> lock(m_inventoryMutex);

    oldQuantity = getResourceQuantityUnlocked(resourceId);

    if (wouldOverflow(oldQuantity, quantity)) {
      INVENTORY_WARN("addResource - Would overflow: " +
                     std::to_string(oldQuantity) + " + " +
                     std::to_string(quantity) + " for " + resourceId);
      return false;
    }

    if (oldQuantity == 0 && m_quantities.size() >= m_maxSlots) {
      INVENTORY_WARN("addResource - Inventory full, cannot add " + resourceId);
      return false;
    }

    newQuantity = oldQuantity + quantity;
    m_quantities[resourceId] = newQuantity;
  }

  notifyResourceChangeSafe(resourceId, oldQuantity, newQuantity);
  return true;
}

bool InventoryComponent::removeResource(const std::string &resourceId,
                                        int quantity) {
  if (quantity <= 0 || resourceId.empty()) {
    return false;
  }

  if (!isValidQuantity(quantity)) {
    INVENTORY_ERROR("removeResource - Invalid quantity: " +
                    std::to_string(quantity) + " for " + resourceId);
    return false;
  }

  int oldQuantity, newQuantity;

  {
    std::lock_guard<std::mutex> lock(m_inventoryMutex);

    oldQuantity = getResourceQuantityUnlocked(resourceId);

    if (wouldUnderflow(oldQuantity, quantity)) {
      INVENTORY_DEBUG("removeResource - Not enough " + resourceId + ": have " +
                      std::to_string(oldQuantity) + ", need " +
                      std::to_string(quantity));
      return false;
    }

    newQuantity = oldQuantity - quantity;
    if (newQuantity == 0) {
      m_quantities.erase(resourceId);
    } else {
      m_quantities[resourceId] = newQuantity;
    }
  } // Release lock before the callback

  notifyResourceChangeSafe(resourceId, oldQuantity, newQuantity);
  return true;
}

void InventoryComponent::refund(const std::string &resourceId, int amount) {
  if (!addResource(resourceId, amount)) {
    INVENTORY_ERROR("refund - Could not return " + std::to_string(amount) +
                    " " + resourceId);
  }
}

int InventoryComponent::getResourceQuantity(
    const std::string &resourceId) const {
  std::lock_guard<std::mutex> lock(m_inventoryMutex);
  return getResourceQuantityUnlocked(resourceId);
}

bool InventoryComponent::hasResource(const std::string &resourceId,
                                     int minimumQuantity) const {
  return getResourceQuantity(resourceId) >= minimumQuantity;
}

void InventoryComponent::clearInventory() {
  std::unordered_map<std::string, int> cleared;
  {
    std::lock_guard<std::mutex> lock(m_inventoryMutex);
    cleared.swap(m_quantities);
  }

  for (const auto &[resourceId, quantity] : cleared) {
    notifyResourceChangeSafe(resourceId, quantity, 0);
  }
}

size_t InventoryComponent::getUsedSlots() const {
  std::lock_guard<std::mutex> lock(m_inventoryMutex);
  return m_quantities.size();
}

bool InventoryComponent::isFull() const { return getUsedSlots() >= m_maxSlots; }

bool InventoryComponent::isEmpty() const { return getUsedSlots() == 0; }

bool InventoryComponent::isValidQuantity(int quantity) const {
  return quantity >= MIN_SAFE_QUANTITY && quantity <= MAX_SAFE_QUANTITY;
}

bool InventoryComponent::wouldOverflow(int currentQuantity,
                                       int addQuantity) const {
  return currentQuantity > MAX_SAFE_QUANTITY - addQuantity;
}

bool InventoryComponent::wouldUnderflow(int currentQuantity,
                                        int removeQuantity) const {
  return currentQuantity - removeQuantity < MIN_SAFE_QUANTITY;
}

std::unordered_map<std::string, int>
InventoryComponent::getAllResources() const {
  std::lock_guard<std::mutex> lock(m_inventoryMutex);
  return m_quantities;
}

std::vector<std::string> InventoryComponent::getResourceIds() const {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(m_inventoryMutex);
    ids.reserve(m_quantities.size());
    for (const auto &[resourceId, quantity] : m_quantities) {
      (void)quantity;
      ids.push_back(resourceId);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

bool InventoryComponent::transferTo(InventoryComponent &target,
                                    const std::string &resourceId,
                                    int quantity) {
  if (&target == this) {
    return false;
  }

  if (!removeResource(resourceId, quantity)) {
    return false;
  }

  if (!target.addResource(resourceId, quantity)) {
    // Put it back so the transfer is all-or-nothing
    if (!addResource(resourceId, quantity)) {
      INVENTORY_CRITICAL("transferTo - Lost " + std::to_string(quantity) +
                         " " + resourceId + " during failed transfer");
    }
    return false;
  }
  return true;
}

int InventoryComponent::getResourceQuantityUnlocked(
    const std::string &resourceId) const {
  auto it = m_quantities.find(resourceId);
  return it != m_quantities.end() ? it->second : 0;
}

void InventoryComponent::notifyResourceChangeSafe(const std::string &resourceId,
                                                  int oldQuantity,
                                                  int newQuantity) {
  // Must be called without holding m_inventoryMutex
  if (m_onResourceChanged) {
    m_onResourceChanged(resourceId, oldQuantity, newQuantity);
  }
}
