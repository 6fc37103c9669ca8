#ifndef SCORER_HPP
#define SCORER_HPP
#include <jsoncons/json.hpp>

#include "../../component/data/plan/plan.hpp"
#include "../problem/problem.hpp"
namespace kernel {
namespace score {
/**
 * @brief 目标函数权重, 默认偏向按时发运而非成本
 *
 */
struct Weights {
  double makespan{1.0};
  double tardiness{10.0};
  double cost{0.1};
  double idle{0.05};
  // 延误按优先级 1..5 放大, 高优先级(1-2) 3 倍, 中(3) 2 倍
  std::array<double, 5> priority_factors{{3, 3, 2, 1, 1}};
  double premium_factor{2.0};  // premium 客户再乘
  double tardiness_factor(int priority, bool premium) const {
    auto idx = std::min(4, std::max(0, priority - 1));
    return priority_factors[idx] * (premium ? premium_factor : 1.0);
  }
};

struct Breakdown {
  int orders{0};
  int makespan{0};
  int tardiness{0};  // 各订单延误之和(分钟)
  double weighted_tardiness{0};  // 按优先级和客户类型加权, 计入目标
  double labor_cost{0};
  double equipment_cost{0};
  int idle{0};  // 各资源空档之和(分钟)
  double objective{0};
  int tardy_orders{0};
  double on_time_rate{0};  // 百分比
  int total_time{0};       // 各订单完成时刻之和
  int total_processing{0};
  int total_waiting{0};
  std::array<int, data::model::kStageCount> stage_duration{};
  std::array<int, data::model::kStageCount> stage_waiting{};
  data::model::StageType bottleneck{data::model::StageType::PICK};
  double bottleneck_wait{0};  // 瓶颈工序的平均等待
  int unscheduled{0};
  jsoncons::json to_json() const;
};

struct Comparison {
  Breakdown optimized;
  Breakdown baseline;
  double total_time_improvement{0};  // 百分比
  double objective_improvement{0};
  double makespan_improvement{0};
  double waiting_reduction{0};
  double cost_savings{0};
  int tardy_orders_reduction{0};
  jsoncons::json to_json() const;
};

/**
 * @brief 对任意计划(优化结果或基线)计算加权目标及分项,
 * 求解器内部使用同一套计算, 保证上报值与搜索目标一致
 *
 */
class Scorer : public WOSObject {
 public:
  Scorer(const std::string& name, Weights w, problem::ProblemPtr p);
  Breakdown score(const data::plan::Plan&) const;
  Comparison compare(const data::plan::Plan& optimized,
                     const data::plan::Plan& baseline) const;
  double objective(const Breakdown&) const;

 public:
  Weights weights;
  double default_hourly_rate{25.0};
  std::map<std::string, double> worker_rates;
  std::map<std::string, double> equipment_costs;
  std::map<std::string, int> deadlines;  // 覆盖计划中缺失的截止时间
  std::map<std::string, double> tardiness_factors;  // 未列出的按计划优先级
};
using ScorerPtr = std::shared_ptr<Scorer>;

double improvement(double baseline, double optimized);
}  // namespace score
}  // namespace kernel
#endif
