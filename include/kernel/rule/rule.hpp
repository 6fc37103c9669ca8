#ifndef RULE_HPP
#define RULE_HPP
#include "../../component/wosobject.hpp"

namespace kernel {
namespace allocate {
class ConstraintEngine;
struct Candidate;
/**
 * @brief 基规则, 候选绑定需通过全部规则才能写入分配
 *
 */
class RuleBase : public WOSObject {
 public:
  using WOSObject::WOSObject;
  virtual bool pass(const Candidate&,
                    const ConstraintEngine&) const = 0;  // pass 才能分配
};
using RulePtr = std::shared_ptr<RuleBase>;
/**
 * @brief 先后约束: 同一订单上一工序完工后才能开始, 且不晚于已安排的下一工序
 *
 */
class PrecedenceRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
/**
 * @brief 技能约束: 人员必须具备该工序能力
 *
 */
class SkillRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
/**
 * @brief 设备匹配: 需要设备的工序绑定同工序类型的设备, 其余工序不绑定
 *
 */
class EquipmentMatchRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
// 时长必须等于人员和设备效率折算后的时长
class DurationRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
/**
 * @brief 人员独占
 *
 */
class WorkerOverlapRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
/**
 * @brief 设备独占
 *
 */
class EquipmentOverlapRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
class HorizonRule : public RuleBase {
 public:
  using RuleBase::RuleBase;
  bool pass(const Candidate&, const ConstraintEngine&) const override;
};
}  // namespace allocate
}  // namespace kernel
#endif
