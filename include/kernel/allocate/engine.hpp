#ifndef ENGINE_HPP
#define ENGINE_HPP
#include "../problem/problem.hpp"
#include "../rule/rule.hpp"
#include "./timeline.hpp"
namespace kernel {
namespace allocate {
/**
 * @brief 工序实例的变量取值, worker < 0 表示未分配
 *
 */
struct Binding {
  int start{-1};
  int duration{0};
  int worker{-1};
  int equipment{-1};
  bool assigned() const { return worker >= 0; }
  int end() const { return start + duration; }
  bool operator==(const Binding& o) const {
    return start == o.start && duration == o.duration && worker == o.worker &&
           equipment == o.equipment;
  }
};
using Assignment = std::vector<Binding>;  // 以 task id 为下标

struct Candidate {
  int task{0};
  int worker{-1};
  int equipment{-1};
  int start{0};
  int duration{0};
  double delta{0};  // 目标函数的边际增量, 由搜索过程填写
  int end() const { return start + duration; }
};

/**
 * @brief 约束网络: 先后, 人员/设备不重叠, 技能与设备域.
 * 持有单次求解内的资源占用表, 对部分分配做增量一致性检查.
 * 截止时间不是硬约束, 只作为目标中的延误项.
 *
 */
class ConstraintEngine : public WOSObject {
 public:
  ConstraintEngine(const std::string& name, problem::ProblemPtr problem);
  std::optional<std::string> check(const Candidate&) const;  // 违反的规则名
  bool assign(const Candidate&);
  void unassign(int task);
  void reset();
  int ready_time(int task) const;
  std::optional<Candidate> place(int task, int worker, int equipment) const;
  std::vector<Candidate> candidates(int task) const;
  std::vector<std::string> verify(const Assignment&) const;
  const Assignment& get_assignment() const { return assignment; }
  size_t assigned_count() const { return assigned; }
  const Timeline& worker_timeline(int w) const { return worker_tl[w]; }
  const Timeline& equipment_timeline(int e) const { return equipment_tl[e]; }
  int next_free_worker(int w) const { return worker_tl[w].last_end(); }
  int next_free_equipment(int e) const { return equipment_tl[e].last_end(); }

 public:
  problem::ProblemPtr problem;
  std::vector<RulePtr> rules;

 private:
  void validate() const;

 private:
  Assignment assignment;
  std::vector<Timeline> worker_tl;
  std::vector<Timeline> equipment_tl;
  size_t assigned{0};
};
using EnginePtr = std::shared_ptr<ConstraintEngine>;
}  // namespace allocate
}  // namespace kernel
#endif
