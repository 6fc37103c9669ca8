#include "../../../include/kernel/rule/rule.hpp"

#include "../../../include/kernel/allocate/engine.hpp"

namespace kernel::allocate {
static bool valid_worker(const Candidate &c, const ConstraintEngine &eng) {
  return c.worker >= 0 &&
         c.worker < static_cast<int>(eng.problem->workers.size());
}

static bool valid_equipment(const Candidate &c, const ConstraintEngine &eng) {
  return c.equipment >= 0 &&
         c.equipment < static_cast<int>(eng.problem->equipment.size());
}

bool PrecedenceRule::pass(const Candidate &c,
                          const ConstraintEngine &eng) const {
  if (c.start < 0) {
    return false;
  }
  auto &task = eng.problem->tasks[c.task];
  auto &ord = eng.problem->orders[task.order];
  auto idx = data::model::stage_index(task.stage);
  auto &a = eng.get_assignment();
  if (idx > 0) {
    auto &pred = a[ord.tasks[idx - 1]];
    if (!pred.assigned() || c.start < pred.end()) {
      return false;
    }
  }
  if (idx < data::model::kStageCount - 1) {
    auto &succ = a[ord.tasks[idx + 1]];
    if (succ.assigned() && c.end() > succ.start) {
      return false;
    }
  }
  return true;
}

bool SkillRule::pass(const Candidate &c, const ConstraintEngine &eng) const {
  if (!valid_worker(c, eng)) {
    return false;
  }
  auto &task = eng.problem->tasks[c.task];
  if (std::find(task.workers.begin(), task.workers.end(), c.worker) ==
      task.workers.end()) {
    return false;
  }
  return eng.problem->workers[c.worker]->can_do(task.stage);
}

bool EquipmentMatchRule::pass(const Candidate &c,
                              const ConstraintEngine &eng) const {
  auto &task = eng.problem->tasks[c.task];
  if (!data::model::requires_equipment(task.stage)) {
    return c.equipment < 0;
  }
  if (!valid_equipment(c, eng)) {
    return false;
  }
  if (std::find(task.equipment.begin(), task.equipment.end(), c.equipment) ==
      task.equipment.end()) {
    return false;
  }
  return eng.problem->equipment[c.equipment]->stage == task.stage;
}

bool DurationRule::pass(const Candidate &c, const ConstraintEngine &eng) const {
  if (!valid_worker(c, eng)) {
    return false;
  }
  auto &task = eng.problem->tasks[c.task];
  int eq = valid_equipment(c, eng) ? c.equipment : -1;
  return c.duration == eng.problem->effective_duration(task, c.worker, eq);
}

bool WorkerOverlapRule::pass(const Candidate &c,
                             const ConstraintEngine &eng) const {
  if (!valid_worker(c, eng)) {
    return false;
  }
  return eng.worker_timeline(c.worker).is_free(c.start, c.end());
}

bool EquipmentOverlapRule::pass(const Candidate &c,
                                const ConstraintEngine &eng) const {
  if (c.equipment < 0) {
    return true;
  }
  if (!valid_equipment(c, eng)) {
    return false;
  }
  return eng.equipment_timeline(c.equipment).is_free(c.start, c.end());
}

bool HorizonRule::pass(const Candidate &c, const ConstraintEngine &eng) const {
  return c.end() <= eng.problem->horizon;
}
}  // namespace kernel::allocate
