#ifndef __OT_INPUT_BUFFER__
#define __OT_INPUT_BUFFER__

#include "Errors.hpp"
#include "Headers.hpp"

namespace ot {
/**
 * @brief Urgency tier of queued terminal input. Lower is more urgent.
 */
enum class InputPriority {
  CONTROL = 0,
  NAVIGATION = 1,
  NORMAL = 2,
  BULK = 3,
};

inline const char* inputPriorityToString(InputPriority priority) {
  switch (priority) {
    case InputPriority::CONTROL:
      return "control";
    case InputPriority::NAVIGATION:
      return "navigation";
    case InputPriority::NORMAL:
      return "normal";
    case InputPriority::BULK:
      return "bulk";
  }
  return "unknown";
}

/**
 * @brief One pending terminal write.
 */
struct BufferedInput {
  string data;
  std::chrono::steady_clock::time_point enqueuedAt;
  InputPriority priority;
  int retryCount;
  // A prefix of the original payload is already on the wire
  bool partiallySent;

  BufferedInput(const string& _data, InputPriority _priority)
      : data(_data),
        enqueuedAt(std::chrono::steady_clock::now()),
        priority(_priority),
        retryCount(0),
        partiallySent(false) {}

  bool isStale(std::chrono::steady_clock::duration timeout) const {
    return std::chrono::steady_clock::now() - enqueuedAt > timeout;
  }
};

/**
 * @brief Bounded queue of pending input, kept sorted by priority and FIFO
 * within a priority.
 *
 * When full, the oldest entries at NORMAL or BULK priority are evicted to
 * make room. CONTROL and NAVIGATION entries are never evicted, nor is the
 * remainder of a partially sent entry; if only those remain, enqueue fails
 * instead. Not thread safe, the owner locks.
 */
class InputBuffer {
 public:
  explicit InputBuffer(size_t _maxEntries) : maxEntries(_maxEntries) {}

  bool empty() const { return entries.empty(); }

  size_t size() const { return entries.size(); }

  /** @brief Number of CONTROL and NAVIGATION entries. */
  size_t highPriorityCount() const {
    return std::count_if(entries.begin(), entries.end(),
                         [](const BufferedInput& entry) {
                           return entry.priority <= InputPriority::NAVIGATION;
                         });
  }

  /**
   * @brief Inserts after every entry of equal or more urgent priority.
   * @return Number of entries evicted to make room.
   * @throws FlowControlError(BUFFER_OVERFLOW) if nothing can be evicted.
   */
  int enqueue(const string& data, InputPriority priority) {
    int evicted = 0;
    while (entries.size() >= maxEntries) {
      auto it = entries.end();
      for (auto candidate = entries.begin(); candidate != entries.end();
           ++candidate) {
        if (candidate->priority >= InputPriority::NORMAL &&
            !candidate->partiallySent &&
            (it == entries.end() || candidate->enqueuedAt < it->enqueuedAt)) {
          it = candidate;
        }
      }
      if (it == entries.end()) {
        throw FlowControlError(FlowControlErrorKind::BUFFER_OVERFLOW,
                               "Input buffer overflow");
      }
      VLOG(1) << "Evicting " << inputPriorityToString(it->priority)
              << " input of " << it->data.size() << " bytes";
      entries.erase(it);
      evicted++;
    }

    auto pos = std::find_if(entries.begin(), entries.end(),
                            [priority](const BufferedInput& entry) {
                              return entry.priority > priority;
                            });
    entries.insert(pos, BufferedInput(data, priority));
    return evicted;
  }

  BufferedInput& front() { return entries.front(); }

  void popFront() { entries.pop_front(); }

  std::deque<BufferedInput>::iterator begin() { return entries.begin(); }

  std::deque<BufferedInput>::iterator end() { return entries.end(); }

  std::deque<BufferedInput>::iterator erase(
      std::deque<BufferedInput>::iterator it) {
    return entries.erase(it);
  }

  void clear() { entries.clear(); }

 private:
  size_t maxEntries;
  std::deque<BufferedInput> entries;
};
}  // namespace ot

#endif  // __OT_INPUT_BUFFER__
