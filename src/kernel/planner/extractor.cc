#include "../../../include/kernel/planner/extractor.hpp"

namespace kernel::planner {
std::vector<data::plan::ResourceUsage> summarize_usage(
    const std::vector<data::plan::OrderPlan>& orders,
    const std::vector<std::string>& ids, bool equipment, int makespan) {
  std::map<std::string, data::plan::ResourceUsage> table;
  for (auto& id : ids) {
    table[id].id = id;
  }
  for (auto& o : orders) {
    for (auto& s : o.stages) {
      std::string id;
      if (equipment) {
        if (!s.equipment.has_value()) {
          continue;
        }
        id = s.equipment.value();
      } else {
        id = s.worker;
      }
      auto& u = table[id];
      if (u.assignments == 0) {
        u.id = id;
        u.first_start = s.start;
        u.last_end = s.end();
      } else {
        u.first_start = std::min(u.first_start, s.start);
        u.last_end = std::max(u.last_end, s.end());
      }
      u.assignments++;
      u.busy += s.duration;
    }
  }
  std::vector<data::plan::ResourceUsage> res;
  auto finish = [makespan](data::plan::ResourceUsage u) {
    if (u.assignments > 0) {
      u.idle = std::max(0, u.last_end - u.first_start - u.busy);
    }
    u.utilization =
        makespan > 0 ? static_cast<double>(u.busy) / makespan : 0.0;
    return u;
  };
  if (!ids.empty()) {
    for (auto& id : ids) {
      res.push_back(finish(table[id]));
      table.erase(id);
    }
  }
  for (auto& x : table) {
    res.push_back(finish(x.second));
  }
  return res;
}

data::plan::Plan Extractor::extract(const allocate::Assignment& a,
                                    const std::string& run) const {
  data::plan::Plan plan;
  plan.run = run;
  plan.wave_start = problem->wave_start;
  for (auto& o : problem->orders) {
    bool done = std::all_of(o.tasks.begin(), o.tasks.end(), [&](int id) {
      return id < static_cast<int>(a.size()) && a[id].assigned();
    });
    if (!done) {
      plan.unscheduled.push_back(o.order->name);
      continue;
    }
    data::plan::OrderPlan op;
    op.order_id = o.order->name;
    op.priority = o.priority;
    op.deadline = o.deadline;
    int prev_end{0};
    for (auto& id : o.tasks) {
      auto& b = a[id];
      data::plan::StageInstance st;
      st.stage = problem->tasks[id].stage;
      st.start = b.start;
      st.duration = b.duration;
      st.waiting = b.start - prev_end;
      st.worker = problem->workers[b.worker]->name;
      if (b.equipment >= 0) {
        st.equipment = problem->equipment[b.equipment]->name;
      }
      prev_end = b.end();
      op.total_processing_time += st.duration;
      op.total_waiting_time += st.waiting;
      op.stages.push_back(st);
    }
    op.total_time = prev_end;
    op.tardiness = std::max(0, op.total_time - o.deadline);
    plan.makespan = std::max(plan.makespan, op.total_time);
    plan.orders.push_back(op);
  }
  plan.complete = plan.unscheduled.empty();
  std::vector<std::string> ids;
  for (auto& w : problem->workers) {
    ids.push_back(w->name);
  }
  plan.workers = summarize_usage(plan.orders, ids, false, plan.makespan);
  ids.clear();
  for (auto& e : problem->equipment) {
    ids.push_back(e->name);
  }
  plan.equipment = summarize_usage(plan.orders, ids, true, plan.makespan);
  return plan;
}
}  // namespace kernel::planner
