#include "../../../include/kernel/problem/problem.hpp"

#include <limits>

namespace kernel::problem {
static int round_up(double minutes) {
  return std::max(1, static_cast<int>(std::ceil(minutes - 1e-9)));
}

int DurationRules::base_duration(const data::model::Order& o,
                                 StageType t, bool powered) const {
  auto items = static_cast<double>(o.item_count);
  bool rush = o.priority.value_or(5) <= rush_priority;
  double minutes{0};
  if (t == StageType::PICK) {
    minutes = o.pick_minutes > 0 ? o.pick_minutes : items * pick_per_item;
    if (rush) {
      minutes *= pick_rush_factor;
    }
    if (o.total_weight > pick_heavy_weight && !powered) {
      minutes *= pick_heavy_factor;
    }
    minutes += o.walking_minutes;
  } else if (t == StageType::CONSOLIDATE) {
    minutes = items * consolidate_per_item;
    if (o.item_count > consolidate_threshold) {
      minutes += (o.item_count - consolidate_threshold) *
                 consolidate_extra_per_item;
    }
  } else if (t == StageType::PACK) {
    minutes = o.pack_minutes > 0 ? o.pack_minutes : items * pack_per_item;
    if (o.total_weight > pack_heavy_weight) {
      minutes *= pack_heavy_factor;
    }
  } else if (t == StageType::LABEL) {
    minutes = label_per_order;
    if (o.item_count > label_threshold) {
      minutes += (o.item_count - label_threshold) * label_extra_per_item;
    }
  } else if (t == StageType::STAGE) {
    minutes = stage_per_order;
    if (o.total_weight > stage_heavy_weight) {
      minutes += stage_heavy_extra;
    }
  } else {
    minutes = ship_per_order;
    if (rush) {
      minutes *= ship_rush_factor;
    }
  }
  return round_up(minutes);
}

int ProblemInstance::effective_duration(const Task& t, int worker,
                                        int equipment) const {
  double factor = workers[worker]->efficiency;
  int base = t.base_duration;
  if (equipment >= 0) {
    auto& eq = this->equipment[equipment];
    factor *= eq->efficiency;
    if (eq->kind == powered_pick_kind) {
      base = t.powered_duration;
    }
  }
  return round_up(base / factor);
}

int ProblemInstance::min_duration(const Task& t) const {
  int res = std::numeric_limits<int>::max();
  for (auto& w : t.workers) {
    if (t.equipment.empty()) {
      res = std::min(res, effective_duration(t, w, -1));
    } else {
      for (auto& e : t.equipment) {
        res = std::min(res, effective_duration(t, w, e));
      }
    }
  }
  return res;
}

std::array<int, data::model::kStageCount> ProblemInstance::stage_load()
    const {
  std::array<int, data::model::kStageCount> res{};
  for (auto& t : tasks) {
    res[data::model::stage_index(t.stage)] += min_duration(t);
  }
  return res;
}

double ProblemInstance::worker_rate(int worker) const {
  return workers[worker]->hourly_rate.value_or(default_hourly_rate);
}

double ProblemInstance::equipment_cost(int equipment) const {
  return equipment < 0 ? 0 : this->equipment[equipment]->hourly_cost;
}

ProblemPtr ProblemBuilder::build(const data::model::Wave& wave) const {
  cpu_timer t("build problem");
  if (wave.orders.empty()) {
    throw error::InvalidInput("batch has no orders");
  }
  if (wave.orders.size() > max_batch_size) {
    throw error::InvalidInput(
        "batch has " + std::to_string(wave.orders.size()) +
        " orders, more than the batch limit " +
        std::to_string(max_batch_size));
  }
  std::vector<std::string> bad;
  std::unordered_set<std::string> ids;
  for (auto& o : wave.orders) {
    if (!o) {
      bad.emplace_back("order record is null");
      continue;
    }
    if (o->name.empty()) {
      bad.emplace_back("order without identifier");
    } else if (!ids.insert(o->name).second) {
      bad.push_back("duplicate order '" + o->name + "'");
    }
    if (!o->priority.has_value()) {
      bad.push_back("order '" + o->name + "' lacks a priority");
    } else if (o->priority.value() < 1 || o->priority.value() > 5) {
      bad.push_back("order '" + o->name + "' priority " +
                    std::to_string(o->priority.value()) +
                    " is outside 1..5");
    }
    if (!o->deadline.has_value()) {
      bad.push_back("order '" + o->name + "' lacks a deadline");
    }
    if (o->item_count < 0 || o->total_weight < 0 || o->pick_minutes < 0 ||
        o->pack_minutes < 0 || o->walking_minutes < 0) {
      bad.push_back("order '" + o->name + "' has a negative quantity");
    }
    if (o->customer_type != "standard" && o->customer_type != "premium") {
      bad.push_back("order '" + o->name + "' customer type '" +
                    o->customer_type + "' is unknown");
    }
  }
  ids.clear();
  for (auto& w : wave.workers) {
    if (!w) {
      bad.emplace_back("worker record is null");
      continue;
    }
    if (w->name.empty() || !ids.insert(w->name).second) {
      bad.push_back("worker identifier '" + w->name +
                    "' is empty or duplicated");
    }
    if (w->efficiency <= 0) {
      bad.push_back("worker '" + w->name + "' efficiency must be positive");
    }
    if (w->hourly_rate.value_or(0) < 0) {
      bad.push_back("worker '" + w->name + "' hourly rate is negative");
    }
  }
  ids.clear();
  for (auto& e : wave.equipment) {
    if (!e) {
      bad.emplace_back("equipment record is null");
      continue;
    }
    if (e->name.empty() || !ids.insert(e->name).second) {
      bad.push_back("equipment identifier '" + e->name +
                    "' is empty or duplicated");
    }
    if (e->efficiency <= 0) {
      bad.push_back("equipment '" + e->name +
                    "' efficiency must be positive");
    }
    if (e->hourly_cost < 0) {
      bad.push_back("equipment '" + e->name + "' hourly cost is negative");
    }
  }
  if (!bad.empty()) {
    for (auto& b : bad) {
      CLOG(ERROR, builder_log) << b;
    }
    throw error::InvalidInput("invalid batch: " + bad.front(), bad);
  }

  auto ins = std::make_shared<ProblemInstance>();
  ins->wave_start = wave.start;
  ins->workers = wave.workers;
  ins->equipment = wave.equipment;
  ins->horizon = horizon;
  ins->default_hourly_rate = default_hourly_rate;
  ins->powered_pick_kind = rules.powered_pick_kind;

  // 资源域: 每种工序的可行人员与设备
  std::array<std::vector<int>, data::model::kStageCount> eligible_workers;
  std::array<std::vector<int>, data::model::kStageCount> eligible_equipment;
  for (auto& s : data::model::kStages) {
    auto idx = data::model::stage_index(s);
    for (int i = 0; i < static_cast<int>(wave.workers.size()); i++) {
      if (wave.workers[i]->can_do(s)) {
        eligible_workers[idx].push_back(i);
      }
    }
    if (eligible_workers[idx].empty()) {
      auto msg = "no worker in the pool can perform stage " +
                 data::model::get_stage_name(s);
      CLOG(ERROR, builder_log) << msg;
      throw error::Infeasible(s, "skill_eligibility", msg);
    }
    if (!data::model::requires_equipment(s)) {
      continue;
    }
    for (int i = 0; i < static_cast<int>(wave.equipment.size()); i++) {
      if (wave.equipment[i]->stage == s) {
        eligible_equipment[idx].push_back(i);
      }
    }
    if (eligible_equipment[idx].empty()) {
      auto msg = "no equipment in the pool serves stage " +
                 data::model::get_stage_name(s);
      CLOG(ERROR, builder_log) << msg;
      throw error::Infeasible(s, "equipment_eligibility", msg);
    }
  }
  for (auto& e : wave.equipment) {
    if (!data::model::requires_equipment(e->stage)) {
      CLOG(WARNING, builder_log)
          << "equipment " << e->name << " serves "
          << data::model::get_stage_name(e->stage)
          << " which needs no equipment, it is never assigned";
    }
  }

  // 决策顺序: 优先级升序, 截止时间升序, 订单号升序
  auto orders = wave.orders;
  std::stable_sort(orders.begin(), orders.end(),
                   [](const data::model::OrderPtr& a,
                      const data::model::OrderPtr& b) {
                     if (a->priority.value() != b->priority.value()) {
                       return a->priority.value() < b->priority.value();
                     }
                     if (a->deadline.value() != b->deadline.value()) {
                       return a->deadline.value() < b->deadline.value();
                     }
                     return a->name < b->name;
                   });
  for (auto& o : orders) {
    OrderVar var;
    var.order = o;
    var.priority = o->priority.value();
    var.deadline = minutes_between(wave.start, o->deadline.value());
    auto order_idx = static_cast<int>(ins->orders.size());
    for (auto& s : data::model::kStages) {
      auto idx = data::model::stage_index(s);
      Task task;
      task.id = static_cast<int>(ins->tasks.size());
      task.order = order_idx;
      task.stage = s;
      task.base_duration = rules.base_duration(*o, s);
      task.powered_duration = rules.base_duration(*o, s, true);
      task.workers = eligible_workers[idx];
      task.equipment = eligible_equipment[idx];
      var.tasks[idx] = task.id;
      ins->tasks.push_back(task);
    }
    int tail{0};
    for (auto it = var.tasks.rbegin(); it != var.tasks.rend(); ++it) {
      ins->tasks[*it].tail = tail;
      tail += ins->min_duration(ins->tasks[*it]);
    }
    ins->orders.push_back(var);
  }
  CLOG(INFO, builder_log) << name << " build " << ins->orders.size()
                          << " orders, " << ins->tasks.size()
                          << " stage instances, " << ins->workers.size()
                          << " workers, " << ins->equipment.size()
                          << " equipment, horizon " << ins->horizon;
  return ins;
}
}  // namespace kernel::problem
