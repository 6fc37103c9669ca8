#include "../../../include/kernel/allocate/engine.hpp"

#include <algorithm>
#include <cmath>

namespace kernel::allocate {
ConstraintEngine::ConstraintEngine(const std::string &name,
                                   problem::ProblemPtr p)
    : WOSObject(name), problem(std::move(p)) {
  if (!problem) {
    throw error::InvalidInput("constraint engine needs a problem instance");
  }
  rules.push_back(std::make_shared<SkillRule>("skill_eligibility"));
  rules.push_back(std::make_shared<EquipmentMatchRule>("equipment_eligibility"));
  rules.push_back(std::make_shared<DurationRule>("duration"));
  rules.push_back(std::make_shared<PrecedenceRule>("precedence"));
  rules.push_back(std::make_shared<WorkerOverlapRule>("worker_capacity"));
  rules.push_back(std::make_shared<EquipmentOverlapRule>("equipment_capacity"));
  rules.push_back(std::make_shared<HorizonRule>("horizon"));
  validate();
  reset();
}

void ConstraintEngine::validate() const {
  for (auto &t : problem->tasks) {
    auto stage = data::model::get_stage_name(t.stage);
    if (t.workers.empty()) {
      throw error::Infeasible(t.stage, "skill_eligibility",
                              "no eligible worker for stage " + stage);
    }
    for (auto &w : t.workers) {
      if (!problem->workers[w]->can_do(t.stage)) {
        throw error::Infeasible(t.stage, "skill_eligibility",
                                "worker " + problem->workers[w]->name +
                                    " cannot perform stage " + stage);
      }
    }
    if (data::model::requires_equipment(t.stage) && t.equipment.empty()) {
      throw error::Infeasible(t.stage, "equipment_eligibility",
                              "no eligible equipment for stage " + stage);
    }
    for (auto &e : t.equipment) {
      if (problem->equipment[e]->stage != t.stage) {
        throw error::Infeasible(t.stage, "equipment_eligibility",
                                "equipment " + problem->equipment[e]->name +
                                    " does not serve stage " + stage);
      }
    }
  }
  for (auto &o : problem->orders) {
    int chain{0};
    for (auto &id : o.tasks) {
      auto &t = problem->tasks[id];
      chain += problem->min_duration(t);
      if (chain > problem->horizon) {
        auto msg = "order " + o.order->name + " cannot finish stage " +
                   data::model::get_stage_name(t.stage) + " within the " +
                   std::to_string(problem->horizon) + " minute horizon";
        CLOG(ERROR, allocate_log) << msg;
        throw error::Infeasible(t.stage, "horizon", msg);
      }
    }
  }

  // 负载检查: 各工序只能在 [最早可开始, 地平线 - 最短后续] 内完成
  auto load = problem->stage_load();
  std::array<std::vector<int>, data::model::kStageCount> pool;
  std::array<size_t, data::model::kStageCount> units{};
  std::array<int, data::model::kStageCount> head;
  std::array<int, data::model::kStageCount> tail;
  head.fill(problem->horizon);
  tail.fill(problem->horizon);
  for (auto &o : problem->orders) {
    int before{0};
    for (auto &id : o.tasks) {
      auto &t = problem->tasks[id];
      auto idx = data::model::stage_index(t.stage);
      pool[idx] = t.workers;
      units[idx] = t.equipment.size();
      head[idx] = std::min(head[idx], before);
      tail[idx] = std::min(tail[idx], t.tail);
      before += problem->min_duration(t);
    }
  }
  auto need = [](int minutes, size_t n) {
    return static_cast<int>(
        std::ceil(static_cast<double>(minutes) / static_cast<double>(n)));
  };
  for (auto &s : data::model::kStages) {
    auto idx = data::model::stage_index(s);
    if (pool[idx].empty()) {
      continue;
    }
    // 可行人员是本工序人员子集的工序, 只能由这批人员完成
    int shared{0};
    for (int j = 0; j < data::model::kStageCount; j++) {
      if (!pool[j].empty() &&
          std::includes(pool[idx].begin(), pool[idx].end(), pool[j].begin(),
                        pool[j].end())) {
        shared += load[j];
      }
    }
    auto cap = pool[idx].size();
    if (units[idx] > 0) {
      cap = std::min(cap, units[idx]);
    }
    auto window = problem->horizon - head[idx] - tail[idx];
    std::string msg;
    if (need(shared, pool[idx].size()) > problem->horizon) {
      msg = "stage " + data::model::get_stage_name(s) + " and the stages " +
            "sharing its workers need " + std::to_string(shared) +
            " minutes on " + std::to_string(pool[idx].size()) +
            " workers, more than the " + std::to_string(problem->horizon) +
            " minute horizon";
    } else if (need(load[idx], cap) > window) {
      msg = "stage " + data::model::get_stage_name(s) + " needs " +
            std::to_string(load[idx]) + " minutes on " + std::to_string(cap) +
            " parallel units, more than the " + std::to_string(window) +
            " minutes left inside the horizon";
    }
    if (!msg.empty()) {
      CLOG(ERROR, allocate_log) << msg;
      throw error::Infeasible(s, "horizon", msg);
    }
  }
}

void ConstraintEngine::reset() {
  assignment.assign(problem->tasks.size(), Binding{});
  worker_tl.assign(problem->workers.size(), Timeline{});
  equipment_tl.assign(problem->equipment.size(), Timeline{});
  assigned = 0;
}

std::optional<std::string> ConstraintEngine::check(const Candidate &c) const {
  if (c.task < 0 || c.task >= static_cast<int>(problem->tasks.size())) {
    return "task";
  }
  for (auto &r : rules) {
    if (!r->pass(c, *this)) {
      return r->name;
    }
  }
  return std::nullopt;
}

bool ConstraintEngine::assign(const Candidate &c) {
  auto violated = check(c);
  if (violated.has_value()) {
    CLOG(DEBUG, allocate_log) << name << " reject task " << c.task
                              << " on rule " << violated.value();
    return false;
  }
  if (assignment[c.task].assigned()) {
    return false;
  }
  worker_tl[c.worker].insert(c.start, c.end(), c.task);
  if (c.equipment >= 0) {
    equipment_tl[c.equipment].insert(c.start, c.end(), c.task);
  }
  assignment[c.task] = Binding{c.start, c.duration, c.worker, c.equipment};
  assigned++;
  return true;
}

void ConstraintEngine::unassign(int task) {
  auto &b = assignment[task];
  if (!b.assigned()) {
    return;
  }
  worker_tl[b.worker].erase(b.start, task);
  if (b.equipment >= 0) {
    equipment_tl[b.equipment].erase(b.start, task);
  }
  b = Binding{};
  assigned--;
}

int ConstraintEngine::ready_time(int task) const {
  auto &t = problem->tasks[task];
  auto idx = data::model::stage_index(t.stage);
  if (idx == 0) {
    return 0;
  }
  auto &pred = assignment[problem->orders[t.order].tasks[idx - 1]];
  return pred.assigned() ? pred.end() : 0;
}

std::optional<Candidate> ConstraintEngine::place(int task, int worker,
                                                 int equipment) const {
  auto &t = problem->tasks[task];
  auto d = problem->effective_duration(t, worker, equipment);
  auto start = ready_time(task);
  // 人员和设备的最早空档交替推进直到一致
  while (true) {
    auto w = worker_tl[worker].earliest_fit(start, d);
    auto e = equipment >= 0 ? equipment_tl[equipment].earliest_fit(w, d) : w;
    start = e;
    if (e == w) {
      break;
    }
  }
  if (start + d > problem->horizon) {
    return std::nullopt;
  }
  Candidate c;
  c.task = task;
  c.worker = worker;
  c.equipment = equipment;
  c.start = start;
  c.duration = d;
  return c;
}

std::vector<Candidate> ConstraintEngine::candidates(int task) const {
  std::vector<Candidate> res;
  auto &t = problem->tasks[task];
  for (auto &w : t.workers) {
    if (t.equipment.empty()) {
      auto c = place(task, w, -1);
      if (c.has_value()) {
        res.push_back(c.value());
      }
      continue;
    }
    for (auto &e : t.equipment) {
      auto c = place(task, w, e);
      if (c.has_value()) {
        res.push_back(c.value());
      }
    }
  }
  return res;
}

std::vector<std::string> ConstraintEngine::verify(const Assignment &a) const {
  std::vector<std::string> res;
  if (a.size() != problem->tasks.size()) {
    res.push_back("assignment covers " + std::to_string(a.size()) +
                  " stage instances, expected " +
                  std::to_string(problem->tasks.size()));
    return res;
  }
  ConstraintEngine tmp(name + "_verify", problem);
  for (auto &t : problem->tasks) {
    auto &b = a[t.id];
    if (!b.assigned()) {
      continue;
    }
    Candidate c;
    c.task = t.id;
    c.worker = b.worker;
    c.equipment = b.equipment;
    c.start = b.start;
    c.duration = b.duration;
    auto violated = tmp.check(c);
    if (violated.has_value()) {
      res.push_back("order " + problem->orders[t.order].order->name +
                    " stage " + data::model::get_stage_name(t.stage) +
                    " violates " + violated.value());
    } else if (!tmp.assign(c)) {
      res.push_back("order " + problem->orders[t.order].order->name +
                    " stage " + data::model::get_stage_name(t.stage) +
                    " could not be committed");
    }
  }
  return res;
}
}  // namespace kernel::allocate
