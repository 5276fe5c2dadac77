#pragma once

#include "tmbdd/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace tmbdd {

// Memoization table for recursive construction.
//
// An entry is absent, pending (its builder is still running) or ready. A
// lookup that finds its own key pending means the construction depends on
// itself, which is reported as a CycleDetectedError instead of recursing
// forever or handing out a half-built value.
template <typename T>
class Memo {
public:
  template <typename Build>
  const T& Get(const std::string& op, const std::string& args, Build&& build) {
    std::string key = op + '\x1f' + args;
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      if (!it->second) throw CycleDetectedError(op, args);
      return *it->second;
    }

    it = entries_.emplace(key, std::nullopt).first;
    try {
      T value = build();
      it->second = std::move(value);
    } catch (...) {
      entries_.erase(it);
      throw;
    }
    return *it->second;
  }

  // Finished value for a key, or nullptr if absent or still pending.
  const T* Find(const std::string& op, const std::string& args) const {
    auto it = entries_.find(op + '\x1f' + args);
    if (it == entries_.end() || !it->second) return nullptr;
    return &*it->second;
  }

  size_t size() const { return entries_.size(); }

private:
  // std::map keeps references stable while build() inserts more entries.
  std::map<std::string, std::optional<T>> entries_;
};

}  // namespace tmbdd
