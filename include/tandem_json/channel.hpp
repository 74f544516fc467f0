/**
 * @file channel.hpp
 * @brief Bounded multi-producer/multi-consumer channel with blocking and
 *        non-blocking put/get and a one-shot close.
 */

#ifndef TANDEM_JSON_CHANNEL_HPP
#define TANDEM_JSON_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tandem {
namespace json {

/// Capacity is clamped to at least one slot. After close(), pushes fail and
/// pops drain the remaining items before reporting end of channel.
template <class T> class Channel {
public:
  explicit Channel(size_t capacity) : capacity_(capacity ? capacity : 1) {}

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /// Blocks while the channel is full. Returns false if the channel is closed.
  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return closed_ || items_.size() < capacity_; });
    if (closed_)
      return false;
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  /// Non-blocking push. On failure the item is left untouched in `item`.
  bool try_push(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_)
      return false;
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  /// Blocks while the channel is empty. Returns nullopt once the channel is
  /// closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty())
      return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  std::optional<T> try_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (items_.empty())
      return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  /// Returns false if the channel was already closed.
  bool close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    return true;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace json
} // namespace tandem

#endif // TANDEM_JSON_CHANNEL_HPP
