#ifndef TIMELINE_HPP
#define TIMELINE_HPP
#include <cstddef>
#include <map>

namespace kernel {
namespace allocate {
/**
 * @brief 单个资源(人员或设备)的占用时间表, 区间 [start, end) 互不重叠
 *
 */
class Timeline {
 public:
  struct Slot {
    int end{0};
    int task{-1};
  };
  bool is_free(int start, int end) const;
  // 从 ready 开始能放下 duration 的最早时刻, 允许插入空档
  int earliest_fit(int ready, int duration) const;
  void insert(int start, int end, int task);
  bool erase(int start, int task);
  void clear();
  bool empty() const { return slots.empty(); }
  std::size_t size() const { return slots.size(); }
  int busy() const { return busy_time; }
  int first_start() const;
  int last_end() const;  // 空闲索引: 该资源最后一次释放的时刻
  int idle() const;      // 首次开工到最后完工之间的空档
  const std::map<int, Slot>& get_slots() const { return slots; }

 private:
  std::map<int, Slot> slots;
  int busy_time{0};
};
}  // namespace allocate
}  // namespace kernel
#endif
