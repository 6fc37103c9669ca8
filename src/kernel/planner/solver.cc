#include "../../../include/kernel/planner/solver.hpp"

#include <limits>
#include <numeric>

namespace kernel::planner {
Solver::Solver(const std::string &name, problem::ProblemPtr p,
               SolverConfig cfg)
    : WOSObject(name),
      config(cfg),
      problem(p),
      engine(std::make_shared<allocate::ConstraintEngine>(name + "_engine", p)),
      extractor(name + "_extractor", p),
      scorer(name + "_scorer", cfg.weights, p),
      rng(cfg.seed) {}

std::string Solver::get_state_name(State s) {
  if (s == State::UNASSIGNED) {
    return "UNASSIGNED";
  } else if (s == State::PARTIALLY_ASSIGNED) {
    return "PARTIALLY_ASSIGNED";
  } else if (s == State::COMPLETE_FEASIBLE) {
    return "COMPLETE_FEASIBLE";
  } else {
    return "COMPLETE_INFEASIBLE";
  }
}

bool Solver::exhausted() const {
  if (cancelled.load()) {
    return true;
  }
  if (config.time_budget.count() > 0 &&
      std::chrono::steady_clock::now() - started >= config.time_budget) {
    return true;
  }
  return false;
}

double Solver::gap(double objective, double bound) const {
  if (objective <= 0) {
    return 0;
  }
  return std::max(0.0, (objective - bound) / objective);
}

/**
 * @brief 下界: 最长单订单链, 各工序资源负载, 不可避免的延误, 最便宜的人工
 *
 * @return double
 */
double Solver::lower_bound() const {
  int chain_bound{0};
  double tardiness{0};
  double cost{0};
  auto load = problem->stage_load();
  std::array<size_t, data::model::kStageCount> workers{};
  std::array<size_t, data::model::kStageCount> equipment{};
  for (auto &o : problem->orders) {
    int chain{0};
    for (auto &id : o.tasks) {
      auto &t = problem->tasks[id];
      auto idx = data::model::stage_index(t.stage);
      auto d = problem->min_duration(t);
      chain += d;
      workers[idx] = t.workers.size();
      equipment[idx] = t.equipment.size();
      double cheapest = std::numeric_limits<double>::max();
      for (auto &w : t.workers) {
        if (t.equipment.empty()) {
          cheapest = std::min(cheapest, problem->effective_duration(t, w, -1) /
                                            60.0 * problem->worker_rate(w));
        }
        for (auto &e : t.equipment) {
          cheapest = std::min(cheapest,
                              problem->effective_duration(t, w, e) / 60.0 *
                                  (problem->worker_rate(w) +
                                   problem->equipment_cost(e)));
        }
      }
      cost += cheapest;
    }
    chain_bound = std::max(chain_bound, chain);
    tardiness += std::max(0, chain - o.deadline) *
                 config.weights.tardiness_factor(o.priority,
                                                 o.order->premium());
  }
  int makespan = chain_bound;
  for (int i = 0; i < data::model::kStageCount; i++) {
    if (workers[i] > 0) {
      makespan = std::max(
          makespan, static_cast<int>(std::ceil(
                        static_cast<double>(load[i]) / workers[i])));
    }
    if (equipment[i] > 0) {
      makespan = std::max(
          makespan, static_cast<int>(std::ceil(
                        static_cast<double>(load[i]) / equipment[i])));
    }
  }
  return config.weights.makespan * makespan +
         config.weights.tardiness * tardiness + config.weights.cost * cost;
}

double Solver::marginal(const allocate::Candidate &c, int makespan) const {
  auto &t = problem->tasks[c.task];
  auto &o = problem->orders[t.order];
  auto &w = config.weights;
  double res = w.makespan * std::max(0, c.end() - makespan);
  // 非发运工序按剩余最短时长估计延误
  res += w.tardiness * std::max(0, c.end() + t.tail - o.deadline) *
         w.tardiness_factor(o.priority, o.order->premium());
  res += w.cost * c.duration / 60.0 *
         (problem->worker_rate(c.worker) + problem->equipment_cost(c.equipment));
  auto idle = [&c](const allocate::Timeline &tl) {
    if (tl.empty()) {
      return 0;
    }
    auto before = tl.last_end() - tl.first_start();
    auto after = std::max(tl.last_end(), c.end()) -
                 std::min(tl.first_start(), c.start);
    return after - before - c.duration;
  };
  int extra = idle(engine->worker_timeline(c.worker));
  if (c.equipment >= 0) {
    extra += idle(engine->equipment_timeline(c.equipment));
  }
  res += w.idle * extra;
  return res;
}

std::vector<allocate::Candidate> Solver::rank(
    std::vector<allocate::Candidate> cands, int makespan) const {
  for (auto &c : cands) {
    c.delta = marginal(c, makespan);
  }
  std::sort(cands.begin(), cands.end(),
            [](const allocate::Candidate &a, const allocate::Candidate &b) {
              if (a.delta != b.delta) {
                return a.delta < b.delta;
              }
              if (a.end() != b.end()) {
                return a.end() < b.end();
              }
              if (a.worker != b.worker) {
                return a.worker < b.worker;
              }
              return a.equipment < b.equipment;
            });
  if (config.max_candidates > 0 &&
      cands.size() > static_cast<size_t>(config.max_candidates)) {
    cands.resize(config.max_candidates);
  }
  return cands;
}

Solver::Build Solver::construct(const std::vector<int> &sequence,
                                Partial *best) {
  engine->reset();
  std::vector<int> tasks;
  for (auto &o : sequence) {
    for (auto &id : problem->orders[o].tasks) {
      tasks.push_back(id);
    }
  }
  std::vector<std::vector<allocate::Candidate>> frames;
  std::vector<size_t> cursor;
  std::vector<int> spans{0};
  size_t depth{0};
  while (depth < tasks.size()) {
    if (exhausted()) {
      return Build::EXHAUSTED;
    }
    if (frames.size() == depth) {
      frames.push_back(rank(engine->candidates(tasks[depth]), spans[depth]));
      cursor.push_back(0);
    }
    auto &frame = frames[depth];
    auto &cur = cursor[depth];
    bool placed{false};
    while (cur < frame.size()) {
      if (engine->assign(frame[cur])) {
        placed = true;
        break;
      }
      cur++;
    }
    if (placed) {
      spans.resize(depth + 1);
      spans.push_back(std::max(spans[depth], frame[cur].end()));
      depth++;
      if (best && depth > best->depth) {
        best->depth = depth;
        best->assignment = engine->get_assignment();
      }
      continue;
    }
    // 当前决策点没有可行候选, 回到上一个决策点换下一个候选
    frames.pop_back();
    cursor.pop_back();
    if (depth == 0) {
      return Build::NO_CANDIDATE;
    }
    depth--;
    backtracks++;
    engine->unassign(tasks[depth]);
    cursor[depth]++;
  }
  return Build::COMPLETE;
}

std::vector<int> Solver::neighbour(const std::vector<int> &seq,
                                   const data::plan::Plan &plan) {
  auto res = seq;
  std::unordered_set<std::string> late;
  for (auto &o : plan.orders) {
    if (o.tardiness > 0) {
      late.insert(o.order_id);
    }
  }
  std::vector<size_t> tardy;
  for (size_t p = 1; p < res.size(); p++) {
    if (late.count(problem->orders[res[p]].order->name) > 0) {
      tardy.push_back(p);
    }
  }
  std::uniform_real_distribution<double> coin(0.0, 1.0);
  if (!tardy.empty() && coin(rng) < 0.5) {
    // 把一个延误订单提前
    std::uniform_int_distribution<size_t> pick(0, tardy.size() - 1);
    auto p = tardy[pick(rng)];
    std::uniform_int_distribution<size_t> to(0, p - 1);
    auto q = to(rng);
    auto v = res[p];
    res.erase(res.begin() + p);
    res.insert(res.begin() + q, v);
  } else {
    std::uniform_int_distribution<size_t> pos(0, res.size() - 2);
    auto i = pos(rng);
    std::swap(res[i], res[i + 1]);
  }
  return res;
}

void Solver::publish(double objective) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  CLOG(DEBUG, planner_log) << name << " incumbent " << objective << " at "
                           << elapsed.count() << "ms, iteration "
                           << iterations;
  if (!publisher) {
    return;
  }
  auto e = std::make_shared<event::Event>(name + "_incumbent");
  e->event_time = std::chrono::steady_clock::now();
  e->event_type = "incumbent";
  e->event_source = name;
  e->values["objective"] = objective;
  e->values["elapsed_ms"] = static_cast<double>(elapsed.count());
  e->values["iteration"] = static_cast<double>(iterations);
  publisher->publish(e);
}

Solver::Result Solver::solve() {
  cpu_timer t(name + " solve");
  started = std::chrono::steady_clock::now();
  iterations = 0;
  backtracks = 0;
  Result res;
  res.lower_bound = lower_bound();
  std::vector<int> seq(problem->orders.size());
  std::iota(seq.begin(), seq.end(), 0);
  state.store(State::PARTIALLY_ASSIGNED);

  Partial partial;
  auto built = construct(seq, &partial);
  if (built != Build::COMPLETE) {
    res.state = State::COMPLETE_INFEASIBLE;
    res.assignment = partial.depth > 0
                         ? partial.assignment
                         : allocate::Assignment(problem->tasks.size());
    res.sequence = seq;
    res.objective = std::numeric_limits<double>::infinity();
    res.partial_objective =
        scorer.score(extractor.extract(res.assignment)).objective;
    res.budget_exhausted = built == Build::EXHAUSTED;
    res.cancelled = cancelled.exchange(false);
    res.backtracks = backtracks;
    res.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    state.store(res.state);
    CLOG(WARNING, planner_log)
        << name << " no complete assignment within bound, "
        << partial.depth << "/" << problem->tasks.size()
        << " stage instances placed, cancelled " << res.cancelled;
    return res;
  }

  auto best = engine->get_assignment();
  auto best_seq = seq;
  auto cur_plan = extractor.extract(best);
  auto best_obj = scorer.score(cur_plan).objective;
  publish(best_obj);
  uint64_t improvements{0};
  auto cur_seq = seq;
  auto cur_obj = best_obj;
  auto temperature = config.initial_temperature;
  std::uniform_real_distribution<double> uniform(0.0, 1.0);
  bool bounded{false};
  while (seq.size() > 1) {
    if (gap(best_obj, res.lower_bound) <= config.target_gap) {
      break;
    }
    if ((config.max_iterations > 0 && iterations >= config.max_iterations) ||
        exhausted()) {
      bounded = true;
      break;
    }
    iterations++;
    auto next = neighbour(cur_seq, cur_plan);
    auto b = construct(next, nullptr);
    if (b == Build::EXHAUSTED) {
      bounded = true;
      break;
    }
    if (b == Build::NO_CANDIDATE) {
      temperature *= config.cooling_rate;
      continue;
    }
    auto plan = extractor.extract(engine->get_assignment());
    auto obj = scorer.score(plan).objective;
    auto u = uniform(rng);
    if (obj < cur_obj ||
        u < std::exp((cur_obj - obj) / std::max(temperature, 1e-9))) {
      cur_seq = next;
      cur_obj = obj;
      cur_plan = plan;
    }
    if (obj < best_obj - 1e-9) {
      best_obj = obj;
      best = engine->get_assignment();
      best_seq = next;
      improvements++;
      publish(best_obj);
    }
    temperature *= config.cooling_rate;
  }
  res.state = State::COMPLETE_FEASIBLE;
  res.assignment = best;
  res.sequence = best_seq;
  res.objective = best_obj;
  res.optimality_gap = gap(best_obj, res.lower_bound);
  res.budget_exhausted = bounded;
  res.cancelled = cancelled.exchange(false);
  res.iterations = iterations;
  res.backtracks = backtracks;
  res.improvements = improvements;
  res.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  state.store(res.state);
  CLOG(INFO, planner_log) << name << " " << get_state_name(res.state)
                          << " objective " << res.objective << " bound "
                          << res.lower_bound << " gap "
                          << res.optimality_gap << " iterations "
                          << iterations << " improvements " << improvements
                          << " backtracks " << backtracks;
  return res;
}
}  // namespace kernel::planner
