#ifndef PROBLEM_HPP
#define PROBLEM_HPP
#include "../../component/data/model/wave.hpp"
#include "../../component/error.hpp"
namespace kernel {
namespace problem {
using data::model::StageType;
/**
 * @brief 各工序的标准工时常量, 由订单属性推出最优可达的基础时长(分钟)
 *
 */
struct DurationRules {
  double pick_per_item{2.0};
  double pick_rush_factor{0.9};
  double pick_heavy_weight{20};
  double pick_heavy_factor{1.2};
  std::string powered_pick_kind{"powered_pick_cart"};  // 免去重货拣货惩罚
  double consolidate_per_item{0.5};
  int consolidate_threshold{5};
  double consolidate_extra_per_item{0.2};
  double pack_per_item{1.5};
  double pack_heavy_weight{15};
  double pack_heavy_factor{1.15};
  double label_per_order{5};
  int label_threshold{3};
  double label_extra_per_item{0.5};
  double stage_per_order{10};
  double stage_heavy_weight{25};
  double stage_heavy_extra{5};
  double ship_per_order{8};
  double ship_rush_factor{0.8};
  int rush_priority{2};  // 该优先级及以上视为加急
  /**
   * @brief 标准设备上的基础时长, powered 为 true 时按电动拣货车计,
   * 重货不再放大拣货时长. 行走时间直接计入拣货
   *
   */
  int base_duration(const data::model::Order&, StageType,
                    bool powered = false) const;
};

/**
 * @brief 工序实例变量: 开始时间 + 人员 + 设备(可选), 域为可行资源下标
 *
 */
struct Task {
  int id{0};
  int order{0};  // instance.orders 下标
  StageType stage{StageType::PICK};
  int base_duration{1};
  int powered_duration{1};  // 电动拣货车上的基础时长, 其他工序同 base
  std::vector<int> workers;
  std::vector<int> equipment;  // 工序不需要设备时为空
  int tail{0};                 // 后续工序最短时长之和
};

struct OrderVar {
  data::model::OrderPtr order;
  int priority{5};
  int deadline{0};  // 相对波次开始的分钟, 可为负
  std::array<int, data::model::kStageCount> tasks{};
};

class ProblemInstance {
 public:
  int task_of(int order, StageType t) const {
    return orders[order].tasks[data::model::stage_index(t)];
  }
  int effective_duration(const Task& t, int worker, int equipment) const;
  int min_duration(const Task& t) const;  // 最快资源组合下的时长
  // 各工序全部订单的最短时长之和
  std::array<int, data::model::kStageCount> stage_load() const;
  double worker_rate(int worker) const;
  double equipment_cost(int equipment) const;

 public:
  std::chrono::system_clock::time_point wave_start;
  std::vector<OrderVar> orders;
  std::vector<data::model::WorkerPtr> workers;
  std::vector<data::model::EquipmentPtr> equipment;
  std::vector<Task> tasks;
  int horizon{1440};
  double default_hourly_rate{25.0};
  std::string powered_pick_kind{"powered_pick_cart"};
};
using ProblemPtr = std::shared_ptr<const ProblemInstance>;

/**
 * @brief 将一个波次的订单和资源池转化为有界的约束优化问题,
 * 记录缺失或非法时抛 InvalidInput, 某工序无可用资源时抛 Infeasible
 *
 */
class ProblemBuilder : public WOSObject {
 public:
  using WOSObject::WOSObject;
  ProblemPtr build(const data::model::Wave&) const;

 public:
  DurationRules rules;
  size_t max_batch_size{500};
  int horizon{1440};
  double default_hourly_rate{25.0};
};
}  // namespace problem
}  // namespace kernel
#endif
