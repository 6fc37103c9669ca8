#include "../../../include/kernel/allocate/timeline.hpp"

#include <algorithm>
#include <iterator>

namespace kernel::allocate {
bool Timeline::is_free(int start, int end) const {
  auto it = slots.lower_bound(start);
  if (it != slots.end() && it->first < end) {
    return false;
  }
  if (it != slots.begin()) {
    auto prev = std::prev(it);
    if (prev->second.end > start) {
      return false;
    }
  }
  return true;
}

int Timeline::earliest_fit(int ready, int duration) const {
  int t = ready;
  auto it = slots.upper_bound(t);
  if (it != slots.begin()) {
    auto prev = std::prev(it);
    t = std::max(t, prev->second.end);
  }
  for (; it != slots.end(); ++it) {
    if (it->first >= t + duration) {
      return t;
    }
    t = std::max(t, it->second.end);
  }
  return t;
}

void Timeline::insert(int start, int end, int task) {
  slots[start] = Slot{end, task};
  busy_time += end - start;
}

bool Timeline::erase(int start, int task) {
  auto it = slots.find(start);
  if (it == slots.end() || it->second.task != task) {
    return false;
  }
  busy_time -= it->second.end - it->first;
  slots.erase(it);
  return true;
}

void Timeline::clear() {
  slots.clear();
  busy_time = 0;
}

int Timeline::first_start() const {
  return slots.empty() ? 0 : slots.begin()->first;
}

int Timeline::last_end() const {
  int res{0};
  // 区间不重叠, 起点最大的区间终点也最大
  if (!slots.empty()) {
    res = slots.rbegin()->second.end;
  }
  return res;
}

int Timeline::idle() const {
  if (slots.empty()) {
    return 0;
  }
  return last_end() - first_start() - busy_time;
}
}  // namespace kernel::allocate
