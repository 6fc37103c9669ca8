#ifndef PLAN_HPP
#define PLAN_HPP
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "../model/stage.hpp"
namespace data {
namespace plan {
using model::StageType;
/**
 * @brief 单个工序实例的执行安排, 时间均为相对波次开始的分钟数
 *
 */
struct StageInstance {
  StageType stage{StageType::PICK};
  int start{0};
  int duration{0};
  int waiting{0};  // 本工序开始前的等待
  std::string worker;
  std::optional<std::string> equipment;
  int end() const { return start + duration; }
  bool operator==(const StageInstance& o) const {
    return stage == o.stage && start == o.start && duration == o.duration &&
           waiting == o.waiting && worker == o.worker &&
           equipment == o.equipment;
  }
};

struct OrderPlan {
  std::string order_id;
  int priority{0};
  std::optional<int> deadline;  // 相对波次开始
  std::vector<StageInstance> stages;
  int total_processing_time{0};
  int total_waiting_time{0};
  int total_time{0};  // 完成时刻
  int tardiness{0};
  bool operator==(const OrderPlan& o) const {
    return order_id == o.order_id && priority == o.priority &&
           deadline == o.deadline && stages == o.stages &&
           total_processing_time == o.total_processing_time &&
           total_waiting_time == o.total_waiting_time &&
           total_time == o.total_time && tardiness == o.tardiness;
  }
};

/**
 * @brief 资源利用汇总
 *
 */
struct ResourceUsage {
  std::string id;
  int assignments{0};
  int busy{0};
  int first_start{0};
  int last_end{0};
  int idle{0};  // 首次开工到最后完工之间的空闲
  double utilization{0};
  bool operator==(const ResourceUsage& o) const {
    return id == o.id && assignments == o.assignments && busy == o.busy &&
           first_start == o.first_start && last_end == o.last_end &&
           idle == o.idle && utilization == o.utilization;
  }
};

struct Plan {
  std::string run;
  std::chrono::system_clock::time_point wave_start;
  std::vector<OrderPlan> orders;
  std::vector<ResourceUsage> workers;
  std::vector<ResourceUsage> equipment;
  std::vector<std::string> unscheduled;  // 预算内未能完整安排的订单
  int makespan{0};
  bool complete{true};
  bool operator==(const Plan& o) const {
    return run == o.run && wave_start == o.wave_start && orders == o.orders &&
           workers == o.workers && equipment == o.equipment &&
           unscheduled == o.unscheduled && makespan == o.makespan &&
           complete == o.complete;
  }
};
}  // namespace plan
}  // namespace data
#endif
