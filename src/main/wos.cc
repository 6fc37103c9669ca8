#include "../../include/main/wos.hpp"

#include <cmath>

json RunResult::to_json() const {
  json res;
  res["run"] = run;
  res["state"] = kernel::planner::Solver::get_state_name(state);
  res["exact"] = exact;
  res["budgetExhausted"] = budget_exhausted;
  res["cancelled"] = cancelled;
  if (std::isinf(objective)) {
    res["objective"] = json::null();
    res["partialObjective"] = partial_objective;
  } else {
    res["objective"] = objective;
  }
  res["lowerBound"] = lower_bound;
  res["optimalityGap"] = optimality_gap;
  res["iterations"] = iterations;
  res["elapsedMs"] = static_cast<int64_t>(elapsed.count());
  res["plan"] = data::codec::plan_to_json(plan);
  res["score"] = score.to_json();
  if (comparison.has_value()) {
    res["comparison"] = comparison->to_json();
  }
  res["deferred"] = json::array();
  for (auto& d : deferred) {
    res["deferred"].push_back(d);
  }
  return res;
}

data::model::Wave WOS::limit_orders(const data::model::Wave& wave,
                                    size_t limit,
                                    std::vector<std::string>& deferred) {
  if (wave.orders.size() <= limit) {
    return wave;
  }
  // 记录不完整时不截断, 交给构建器报错
  for (auto& o : wave.orders) {
    if (!o || !o->priority.has_value() || !o->deadline.has_value()) {
      return wave;
    }
  }
  auto res = wave;
  std::stable_sort(res.orders.begin(), res.orders.end(),
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
  for (auto it = res.orders.begin() + limit; it != res.orders.end(); ++it) {
    deferred.push_back((*it)->name);
  }
  res.orders.resize(limit);
  CLOG(INFO, wos_log) << "order limit " << limit << ", defer "
                      << deferred.size() << " orders to a later wave";
  return res;
}

RunResult WOS::run(const data::model::Wave& wave,
                   const std::optional<data::plan::Plan>& baseline) {
  return run(wave, options, baseline);
}

RunResult WOS::run(const data::model::Wave& wave, const Options& opt,
                   const std::optional<data::plan::Plan>& baseline) {
  RunResult res;
  res.run = "Run_" + uuids::to_string(get_uuid());
  {
    std::lock_guard<std::mutex> lock(mut);
    active[res.run] = ActiveRun{};
  }
  kernel::problem::ProblemPtr problem;
  kernel::planner::Solver::Result r;
  try {
    auto batch = opt.order_limit > 0
                     ? limit_orders(wave, opt.order_limit, res.deferred)
                     : wave;
    kernel::problem::ProblemBuilder builder(res.run + "_builder");
    builder.rules = opt.durations;
    builder.max_batch_size = opt.max_batch_size;
    builder.horizon = opt.horizon_minutes;
    builder.default_hourly_rate = opt.default_hourly_rate;
    problem = builder.build(batch);

    auto solver = std::make_shared<kernel::planner::Solver>(res.run, problem,
                                                            opt.solver);
    solver->publisher = publisher;
    {
      std::lock_guard<std::mutex> lock(mut);
      auto& entry = active[res.run];
      entry.solver = solver;
      if (entry.cancel_pending) {
        CLOG(INFO, wos_log) << res.run << " cancelled before solving";
        solver->cancel();
      }
    }
    r = solver->solve();
  } catch (std::exception&) {
    std::lock_guard<std::mutex> lock(mut);
    active.erase(res.run);
    throw;
  }
  {
    std::lock_guard<std::mutex> lock(mut);
    active.erase(res.run);
  }

  kernel::planner::Extractor extractor(res.run + "_extractor", problem);
  res.plan = extractor.extract(r.assignment, res.run);
  kernel::allocate::ConstraintEngine checker(res.run + "_checker", problem);
  auto violations = checker.verify(r.assignment);
  if (!violations.empty()) {
    for (auto& v : violations) {
      CLOG(ERROR, wos_log) << res.run << " " << v;
    }
    throw error::SolveError("plan violates hard constraints: " +
                            violations.front());
  }
  kernel::score::Scorer scorer(res.run + "_scorer", opt.solver.weights,
                               problem);
  res.score = scorer.score(res.plan);
  if (baseline.has_value()) {
    res.comparison = scorer.compare(res.plan, baseline.value());
  }
  res.state = r.state;
  res.budget_exhausted = r.budget_exhausted;
  res.cancelled = r.cancelled;
  res.exact = r.complete() && !r.budget_exhausted;
  res.objective = r.objective;
  res.partial_objective = r.partial_objective;
  res.lower_bound = r.lower_bound;
  res.optimality_gap = r.optimality_gap;
  res.iterations = r.iterations;
  res.elapsed = r.elapsed;
  CLOG(INFO, wos_log) << res.run << " "
                      << kernel::planner::Solver::get_state_name(res.state)
                      << ", " << res.plan.orders.size() << " orders planned, "
                      << res.plan.unscheduled.size() << " unscheduled, "
                      << res.deferred.size() << " deferred, makespan "
                      << res.plan.makespan << ", objective "
                      << res.score.objective;
  return res;
}

ScenarioOutcome WOS::run_scenario(const Scenario& s) {
  ScenarioOutcome out;
  out.name = s.name;
  try {
    out.result = run(s.wave, s.options.value_or(options), s.baseline);
  } catch (error::InvalidInput& ec) {
    out.code = BadRequest_400;
    out.error = json::array();
    for (auto& d : ec.details()) {
      out.error.push_back(d);
    }
  } catch (error::Infeasible& ec) {
    out.code = UnprocessableEntity_422;
    out.error["stage"] = data::model::get_stage_name(ec.stage());
    out.error["constraint"] = ec.constraint();
    out.error["message"] = ec.what();
  } catch (std::exception& ec) {
    out.code = InternalServerError_500;
    out.error = json::array();
    out.error.push_back(ec.what());
  }
  if (out.code != OK_200) {
    CLOG(ERROR, wos_log) << "scenario " << s.name << " failed with "
                         << out.code << ": " << out.error.to_string();
  }
  return out;
}

std::vector<ScenarioOutcome> WOS::run_scenarios(
    const std::vector<Scenario>& scenarios) {
  std::vector<ScenarioOutcome> res(scenarios.size());
  std::vector<std::thread> ths;
  for (size_t i = 0; i < scenarios.size(); i++) {
    ths.emplace_back([this, i, &res, &scenarios] {
      res[i] = run_scenario(scenarios[i]);
    });
  }
  for (auto& th : ths) {
    if (th.joinable()) {
      th.join();
    }
  }
  return res;
}

Options WOS::override_options(const json& cfg) const {
  auto opt = options;
  std::vector<std::string> bad;
  auto non_negative = [&bad, &cfg](const std::string& key) {
    if (!cfg.contains(key)) {
      return false;
    }
    if (!cfg.at(key).is_number() || cfg.at(key).as<double>() < 0) {
      bad.push_back("config." + key + " must be a non-negative number");
      return false;
    }
    return true;
  };
  if (non_negative("timeBudgetMs")) {
    opt.solver.time_budget =
        std::chrono::milliseconds(cfg.at("timeBudgetMs").as<int64_t>());
  }
  if (non_negative("maxIterations")) {
    opt.solver.max_iterations = cfg.at("maxIterations").as<uint64_t>();
  }
  if (non_negative("orderLimit")) {
    opt.order_limit = cfg.at("orderLimit").as<size_t>();
  }
  if (non_negative("maxCandidates")) {
    opt.solver.max_candidates = cfg.at("maxCandidates").as<int>();
  }
  if (non_negative("horizonMinutes")) {
    opt.horizon_minutes = cfg.at("horizonMinutes").as<int>();
  }
  if (non_negative("seed")) {
    opt.solver.seed = cfg.at("seed").as<uint32_t>();
  }
  if (cfg.contains("weights")) {
    auto& w = cfg.at("weights");
    std::vector<std::pair<std::string, double*>> fields{
        {"makespan", &opt.solver.weights.makespan},
        {"tardiness", &opt.solver.weights.tardiness},
        {"cost", &opt.solver.weights.cost},
        {"idle", &opt.solver.weights.idle}};
    for (auto& f : fields) {
      if (!w.contains(f.first)) {
        continue;
      }
      if (!w.at(f.first).is_number() || w.at(f.first).as<double>() < 0) {
        bad.push_back("config.weights." + f.first +
                      " must be a non-negative number");
        continue;
      }
      *f.second = w.at(f.first).as<double>();
    }
  }
  if (opt.solver.time_budget.count() == 0 && opt.solver.max_iterations == 0) {
    bad.emplace_back("config needs a time budget or an iteration cap");
  }
  if (!bad.empty()) {
    throw error::InvalidInput("invalid run configuration", bad);
  }
  return opt;
}

RET WOS::post_optimization(const std::string& body) {
  try {
    json req;
    try {
      req = json::parse(body);
    } catch (jsoncons::ser_error& ec) {
      throw error::InvalidInput(std::string{"Could not parse JSON input: "} +
                                ec.what());
    }
    const json& batch = req.contains("batch") ? req.at("batch") : req;
    auto wave = data::codec::wave_from_json(batch);
    std::optional<data::plan::Plan> baseline;
    if (req.contains("baseline") && !req.at("baseline").is_null()) {
      baseline = data::codec::plan_from_json(req.at("baseline"));
    }
    auto opt =
        req.contains("config") ? override_options(req.at("config")) : options;
    auto r = run(wave, opt, baseline);
    return std::pair<int, std::string>(OK_200, r.to_json().to_string());
  } catch (error::InvalidInput& ec) {
    json res = json::array();
    for (auto& d : ec.details()) {
      res.push_back(d);
    }
    CLOG(ERROR, wos_log) << "invalid input: " << ec.what();
    return std::pair<int, std::string>(BadRequest_400, res.to_string());
  } catch (error::Infeasible& ec) {
    json res;
    res["stage"] = data::model::get_stage_name(ec.stage());
    res["constraint"] = ec.constraint();
    res["message"] = ec.what();
    CLOG(ERROR, wos_log) << "infeasible: " << ec.what();
    return std::pair<int, std::string>(UnprocessableEntity_422,
                                       res.to_string());
  } catch (std::exception& ec) {
    json res = json::array();
    res.push_back(ec.what());
    CLOG(ERROR, wos_log) << ec.what();
    return std::pair<int, std::string>(InternalServerError_500,
                                       res.to_string());
  }
}

void WOS::cancel() {
  std::lock_guard<std::mutex> lock(mut);
  for (auto& x : active) {
    x.second.cancel_pending = true;
    auto s = x.second.solver.lock();
    CLOG(INFO, wos_log) << "cancel " << x.first;
    if (s) {
      s->cancel();
    }
  }
}

size_t WOS::running() const {
  std::lock_guard<std::mutex> lock(mut);
  return active.size();
}
