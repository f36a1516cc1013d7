// Observable value channel: explicit publish/subscribe for published state.

#ifndef VITALS_CORE_OBSERVABLE_H
#define VITALS_CORE_OBSERVABLE_H

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace vitals {

/// Handle returned by Observable::subscribe. 0 is never issued.
using SubscriptionId = uint32_t;

/// @brief Holds a value and notifies subscribers when it changes.
///
/// set() compares with operator== and stays silent when nothing changed,
/// which keeps downstream pipelines from recomputing on identical updates.
/// Subscribers run synchronously on the caller's (serial) context, in
/// subscription order. A subscriber may unsubscribe itself or others while
/// being notified.
///
/// @tparam T Value type; must be copyable and equality comparable.
template <typename T>
class Observable {
 public:
  using Callback = std::function<void(const T&)>;

  Observable() = default;
  explicit Observable(T initial) : value_(std::move(initial)) {}

  Observable(const Observable&) = delete;
  Observable& operator=(const Observable&) = delete;

  /// @brief Current value.
  const T& get() const { return value_; }

  /// @brief Replace the value; notifies only if it differs.
  /// @return True if subscribers were notified.
  bool set(const T& value) {
    if (value == value_) return false;
    value_ = value;
    notify();
    return true;
  }

  /// @brief Register a callback for future changes (not called immediately).
  SubscriptionId subscribe(Callback callback) {
    SubscriptionId id = next_id_++;
    subscribers_.push_back({id, std::move(callback)});
    return id;
  }

  /// @brief Remove a subscription. Unknown ids are ignored.
  void unsubscribe(SubscriptionId id) {
    for (auto& entry : subscribers_) {
      if (entry.id == id) entry.id = 0;
    }
    if (notify_depth_ == 0) compact();
  }

  /// @brief Number of live subscriptions.
  size_t subscriberCount() const {
    size_t count = 0;
    for (const auto& entry : subscribers_) {
      if (entry.id != 0) ++count;
    }
    return count;
  }

 private:
  struct Entry {
    SubscriptionId id;
    Callback callback;
  };

  void notify() {
    ++notify_depth_;
    // Index loop: callbacks may subscribe (append) during notification.
    const size_t count = subscribers_.size();
    for (size_t idx = 0; idx < count; ++idx) {
      if (subscribers_[idx].id == 0) continue;
      Callback callback = subscribers_[idx].callback;
      callback(value_);
    }
    --notify_depth_;
    if (notify_depth_ == 0) compact();
  }

  void compact() {
    std::vector<Entry> live;
    live.reserve(subscribers_.size());
    for (auto& entry : subscribers_) {
      if (entry.id != 0) live.push_back(std::move(entry));
    }
    subscribers_.swap(live);
  }

  T value_{};
  std::vector<Entry> subscribers_;
  SubscriptionId next_id_ = 1;
  int notify_depth_ = 0;
};

}  // namespace vitals

#endif  // VITALS_CORE_OBSERVABLE_H
