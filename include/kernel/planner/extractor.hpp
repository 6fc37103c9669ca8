#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP
#include "../../component/data/plan/plan.hpp"
#include "../allocate/engine.hpp"
namespace kernel {
namespace planner {
/**
 * @brief 把求解器的变量取值转为计划, 只做算术推导, 不重新求解.
 * 同一分配总是得到完全相同的计划
 *
 */
class Extractor : public WOSObject {
 public:
  Extractor(const std::string& name, problem::ProblemPtr p)
      : WOSObject(name), problem(std::move(p)) {}
  data::plan::Plan extract(const allocate::Assignment&,
                           const std::string& run = "") const;

 public:
  problem::ProblemPtr problem;
};

/**
 * @brief 按资源汇总计划中的占用
 *
 * @param orders 计划中的订单
 * @param ids 需要列出的资源, 为空时取计划中出现过的资源(按名称排序)
 * @param equipment true 统计设备, false 统计人员
 * @param makespan 用于计算利用率
 * @return std::vector<data::plan::ResourceUsage>
 */
std::vector<data::plan::ResourceUsage> summarize_usage(
    const std::vector<data::plan::OrderPlan>& orders,
    const std::vector<std::string>& ids, bool equipment, int makespan);
}  // namespace planner
}  // namespace kernel
#endif
