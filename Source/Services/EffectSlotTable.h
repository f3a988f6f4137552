/*
  ==============================================================================
    Source/Services/EffectSlotTable.h
    Role: Host effect id -> (last command, native handle). Fixed-size arena
    with a free list; a full table refuses new ids instead of reusing a slot.
    Single owner (the effect-forwarding thread), so no locking.
  ==============================================================================
*/
#pragma once
#include "EffectCommand.h"
#include <unordered_map>
#include <vector>

class EffectSlotTable {
public:
  struct Entry {
    int effectId = -1;
    EffectCommand command;
    NativeEffectHandle native = kInvalidHandle; // kInvalidHandle: not on the wheel yet
    bool inUse = false;
  };

  explicit EffectSlotTable(int capacity) : slots((size_t)juce::jmax(1, capacity)) {
    freeList.reserve(slots.size());
    for (int i = (int)slots.size() - 1; i >= 0; --i)
      freeList.push_back(i);
  }

  /** Existing entry for the id, or a fresh slot; nullptr when full. */
  Entry *acquire(int effectId) {
    if (auto *existing = find(effectId))
      return existing;
    if (freeList.empty())
      return nullptr;
    const int index = freeList.back();
    freeList.pop_back();
    auto &e = slots[(size_t)index];
    e = Entry();
    e.effectId = effectId;
    e.inUse = true;
    byId[effectId] = index;
    return &e;
  }

  Entry *find(int effectId) {
    auto it = byId.find(effectId);
    return it == byId.end() ? nullptr : &slots[(size_t)it->second];
  }

  /** Returns false if the id was not present. */
  bool release(int effectId) {
    auto it = byId.find(effectId);
    if (it == byId.end())
      return false;
    slots[(size_t)it->second] = Entry();
    freeList.push_back(it->second);
    byId.erase(it);
    return true;
  }

  template <typename Fn> void forEach(Fn &&fn) {
    for (auto &e : slots)
      if (e.inUse)
        fn(e);
  }

  void clear() {
    std::vector<int> ids;
    forEach([&ids](Entry &e) { ids.push_back(e.effectId); });
    for (int id : ids)
      release(id);
  }

  int size() const { return (int)byId.size(); }
  int capacity() const { return (int)slots.size(); }

private:
  std::vector<Entry> slots;
  std::vector<int> freeList;
  std::unordered_map<int, int> byId;
};
