#include "../../../include/kernel/score/scorer.hpp"

#include "../../../include/kernel/planner/extractor.hpp"

namespace kernel::score {
using json = jsoncons::json;
double improvement(double baseline, double optimized) {
  if (baseline <= 0) {
    return 0;
  }
  return (baseline - optimized) / baseline * 100.0;
}

Scorer::Scorer(const std::string& name, Weights w, problem::ProblemPtr p)
    : WOSObject(name), weights(w) {
  if (p) {
    default_hourly_rate = p->default_hourly_rate;
    for (int i = 0; i < static_cast<int>(p->workers.size()); i++) {
      worker_rates[p->workers[i]->name] = p->worker_rate(i);
    }
    for (auto& e : p->equipment) {
      equipment_costs[e->name] = e->hourly_cost;
    }
    for (auto& o : p->orders) {
      deadlines[o.order->name] = o.deadline;
      tardiness_factors[o.order->name] =
          weights.tardiness_factor(o.priority, o.order->premium());
    }
  }
}

double Scorer::objective(const Breakdown& b) const {
  return weights.makespan * b.makespan + weights.tardiness * b.weighted_tardiness +
         weights.cost * (b.labor_cost + b.equipment_cost) +
         weights.idle * b.idle;
}

Breakdown Scorer::score(const data::plan::Plan& plan) const {
  Breakdown res;
  res.orders = static_cast<int>(plan.orders.size());
  res.unscheduled = static_cast<int>(plan.unscheduled.size());
  for (auto& o : plan.orders) {
    int prev_end{0};
    for (auto& s : o.stages) {
      auto idx = data::model::stage_index(s.stage);
      res.stage_duration[idx] += s.duration;
      res.stage_waiting[idx] += s.waiting;
      res.total_processing += s.duration;
      res.total_waiting += s.waiting;
      auto rate = worker_rates.find(s.worker);
      res.labor_cost += s.duration / 60.0 *
                        (rate == worker_rates.end() ? default_hourly_rate
                                                    : rate->second);
      if (s.equipment.has_value()) {
        auto cost = equipment_costs.find(s.equipment.value());
        if (cost != equipment_costs.end()) {
          res.equipment_cost += s.duration / 60.0 * cost->second;
        }
      }
      prev_end = std::max(prev_end, s.end());
    }
    res.total_time += prev_end;
    res.makespan = std::max(res.makespan, prev_end);
    std::optional<int> deadline = o.deadline;
    auto it = deadlines.find(o.order_id);
    if (it != deadlines.end()) {
      deadline = it->second;
    }
    if (deadline.has_value() && prev_end > deadline.value()) {
      auto factor = tardiness_factors.find(o.order_id);
      res.tardiness += prev_end - deadline.value();
      res.weighted_tardiness +=
          (prev_end - deadline.value()) *
          (factor == tardiness_factors.end()
               ? weights.tardiness_factor(o.priority, false)
               : factor->second);
      res.tardy_orders++;
    }
  }
  for (auto& u : planner::summarize_usage(plan.orders, {}, false, 0)) {
    res.idle += u.idle;
  }
  for (auto& u : planner::summarize_usage(plan.orders, {}, true, 0)) {
    res.idle += u.idle;
  }
  if (res.orders > 0) {
    res.on_time_rate =
        100.0 * (res.orders - res.tardy_orders) / static_cast<double>(res.orders);
    for (auto& s : data::model::kStages) {
      double mean = static_cast<double>(
                        res.stage_waiting[data::model::stage_index(s)]) /
                    res.orders;
      if (mean > res.bottleneck_wait) {
        res.bottleneck_wait = mean;
        res.bottleneck = s;
      }
    }
  }
  res.objective = objective(res);
  return res;
}

Comparison Scorer::compare(const data::plan::Plan& optimized,
                           const data::plan::Plan& baseline) const {
  Comparison res;
  res.optimized = score(optimized);
  res.baseline = score(baseline);
  res.total_time_improvement =
      improvement(res.baseline.total_time, res.optimized.total_time);
  res.objective_improvement =
      improvement(res.baseline.objective, res.optimized.objective);
  res.makespan_improvement =
      improvement(res.baseline.makespan, res.optimized.makespan);
  res.waiting_reduction =
      improvement(res.baseline.total_waiting, res.optimized.total_waiting);
  res.cost_savings = (res.baseline.labor_cost + res.baseline.equipment_cost) -
                     (res.optimized.labor_cost + res.optimized.equipment_cost);
  res.tardy_orders_reduction =
      res.baseline.tardy_orders - res.optimized.tardy_orders;
  CLOG(INFO, score_log) << name << " total time improvement "
                        << res.total_time_improvement << "%, objective "
                        << res.baseline.objective << " -> "
                        << res.optimized.objective;
  return res;
}

json Breakdown::to_json() const {
  json res;
  res["orders"] = orders;
  res["makespan"] = makespan;
  res["tardiness"] = tardiness;
  res["weightedTardiness"] = weighted_tardiness;
  res["tardyOrders"] = tardy_orders;
  res["onTimeRate"] = on_time_rate;
  res["laborCost"] = labor_cost;
  res["equipmentCost"] = equipment_cost;
  res["idle"] = idle;
  res["objective"] = objective;
  res["totalTime"] = total_time;
  res["totalProcessingTime"] = total_processing;
  res["totalWaitingTime"] = total_waiting;
  res["stages"] = json::array();
  for (auto& s : data::model::kStages) {
    json value;
    auto idx = data::model::stage_index(s);
    value["stage"] = data::model::get_stage_name(s);
    value["duration"] = stage_duration[idx];
    value["waiting"] = stage_waiting[idx];
    res["stages"].push_back(value);
  }
  res["bottleneck"] = data::model::get_stage_name(bottleneck);
  res["bottleneckMeanWaiting"] = bottleneck_wait;
  res["unscheduled"] = unscheduled;
  return res;
}

json Comparison::to_json() const {
  json res;
  res["optimized"] = optimized.to_json();
  res["baseline"] = baseline.to_json();
  res["totalTimeImprovement"] = total_time_improvement;
  res["objectiveImprovement"] = objective_improvement;
  res["makespanImprovement"] = makespan_improvement;
  res["waitingReduction"] = waiting_reduction;
  res["costSavings"] = cost_savings;
  res["tardyOrdersReduction"] = tardy_orders_reduction;
  return res;
}
}  // namespace kernel::score
