#include <utest.h>

#include <cmath>

#include "../../include/main/wos.hpp"

INITIALIZE_EASYLOGGINGPP
static const auto kStart = get_time_from_str("2026-10-19T08:00:00Z").value();

static json caps(std::initializer_list<const char*> names) {
  json res = json::array();
  for (auto& n : names) {
    res.push_back(n);
  }
  return res;
}

static json make_batch(int orders, bool label = true) {
  json batch;
  batch["waveStart"] = get_time_fmt_utc(kStart);
  batch["orders"] = json::array();
  for (int i = 0; i < orders; i++) {
    json o;
    o["orderId"] = "O" + std::to_string(i + 1);
    o["priority"] = 1 + i % 5;
    o["deadline"] = get_time_fmt_utc(kStart + std::chrono::minutes(60 + 30 * i));
    o["itemCount"] = 3 + i % 4;
    o["totalWeight"] = 2.5 * i;
    batch["orders"].push_back(o);
  }
  batch["workers"] = json::array();
  json w1;
  w1["workerId"] = "W1";
  w1["capabilities"] = caps({"PICK", "CONSOLIDATE", "PACK"});
  w1["hourlyRate"] = 21.0;
  batch["workers"].push_back(w1);
  json w2;
  w2["workerId"] = "W2";
  w2["capabilities"] = label ? caps({"LABEL", "STAGE", "SHIP"})
                             : caps({"STAGE", "SHIP"});
  batch["workers"].push_back(w2);
  json w3;
  w3["workerId"] = "W3";
  w3["capabilities"] = caps({"PICK", "PACK", "SHIP"});
  w3["efficiency"] = 1.1;
  batch["workers"].push_back(w3);
  batch["equipment"] = json::array();
  for (auto s : {"PICK", "PACK", "SHIP"}) {
    json e;
    e["equipmentId"] = std::string(s) + "_1";
    e["stage"] = s;
    e["hourlyCost"] = 1.5;
    batch["equipment"].push_back(e);
  }
  return batch;
}

static Options test_options() {
  Options opt;
  opt.solver.time_budget = std::chrono::milliseconds(0);
  opt.solver.max_iterations = 10;
  return opt;
}

UTEST(wos, post_optimization) {
  WOS wos(test_options());
  json body;
  body["batch"] = make_batch(3);
  auto ret = wos.post_optimization(body.to_string());
  ASSERT_EQ(ret.first, 200);
  auto res = json::parse(ret.second);
  EXPECT_STREQ(res.at("state").as_string().c_str(), "COMPLETE_FEASIBLE");
  EXPECT_EQ(res.at("plan").at("orders").size(), 3u);
  EXPECT_TRUE(res.at("plan").at("complete").as<bool>());
  EXPECT_EQ(res.at("iterations").as<int>(), 10);
  EXPECT_TRUE(res.at("budgetExhausted").as<bool>());
  EXPECT_FALSE(res.at("exact").as<bool>());
  EXPECT_FALSE(res.contains("comparison"));
  EXPECT_EQ(res.at("deferred").size(), 0u);
  EXPECT_GE(res.at("score").at("objective").as<double>(),
            res.at("lowerBound").as<double>() - 1e-6);
  EXPECT_NEAR(res.at("objective").as<double>(),
              res.at("score").at("objective").as<double>(), 1e-6);
  EXPECT_FALSE(res.contains("partialObjective"));
  EXPECT_EQ(wos.running(), 0u);
}

UTEST(wos, raw_batch_body) {
  WOS wos(test_options());
  auto ret = wos.post_optimization(make_batch(2).to_string());
  EXPECT_EQ(ret.first, 200);
}

UTEST(wos, compare_with_baseline) {
  WOS wos(test_options());
  json body;
  body["batch"] = make_batch(4);
  auto first = json::parse(wos.post_optimization(body.to_string()).second);
  body["baseline"] = first.at("plan");
  auto ret = wos.post_optimization(body.to_string());
  ASSERT_EQ(ret.first, 200);
  auto res = json::parse(ret.second);
  ASSERT_TRUE(res.contains("comparison"));
  auto& cmp = res.at("comparison");
  // 相同种子, 相同结果
  EXPECT_NEAR(cmp.at("totalTimeImprovement").as<double>(), 0.0, 1e-9);
  EXPECT_NEAR(cmp.at("objectiveImprovement").as<double>(), 0.0, 1e-9);
  EXPECT_EQ(cmp.at("tardyOrdersReduction").as<int>(), 0);
}

UTEST(wos, config_overrides) {
  WOS wos(test_options());
  json body;
  body["batch"] = make_batch(3);
  json cfg;
  cfg["orderLimit"] = 2;
  cfg["maxIterations"] = 4;
  cfg["weights"] = json();
  cfg["weights"]["tardiness"] = 2.0;
  body["config"] = cfg;
  auto ret = wos.post_optimization(body.to_string());
  ASSERT_EQ(ret.first, 200);
  auto res = json::parse(ret.second);
  EXPECT_EQ(res.at("plan").at("orders").size(), 2u);
  ASSERT_EQ(res.at("deferred").size(), 1u);
  EXPECT_STREQ(res.at("deferred")[0].as_string().c_str(), "O3");
  EXPECT_EQ(res.at("iterations").as<int>(), 4);
}

UTEST(wos, invalid_input) {
  WOS wos(test_options());
  auto ret = wos.post_optimization("{\"batch\": [");
  EXPECT_EQ(ret.first, 400);

  auto batch = make_batch(3);
  batch["orders"][1].erase("priority");
  json body;
  body["batch"] = batch;
  ret = wos.post_optimization(body.to_string());
  ASSERT_EQ(ret.first, 400);
  auto res = json::parse(ret.second);
  ASSERT_TRUE(res.is_array());
  ASSERT_EQ(res.size(), 1u);
  EXPECT_NE(res[0].as_string().find("O2"), std::string::npos);
  EXPECT_NE(res[0].as_string().find("lacks a priority"), std::string::npos);

  body["batch"] = make_batch(3);
  body["config"] = json();
  body["config"]["timeBudgetMs"] = -5;
  ret = wos.post_optimization(body.to_string());
  EXPECT_EQ(ret.first, 400);

  body["config"]["timeBudgetMs"] = 0;
  body["config"]["maxIterations"] = 0;
  ret = wos.post_optimization(body.to_string());
  EXPECT_EQ(ret.first, 400);
}

UTEST(wos, infeasible) {
  WOS wos(test_options());
  json body;
  body["batch"] = make_batch(3, false);
  auto ret = wos.post_optimization(body.to_string());
  ASSERT_EQ(ret.first, 422);
  auto res = json::parse(ret.second);
  EXPECT_STREQ(res.at("stage").as_string().c_str(), "LABEL");
  EXPECT_STREQ(res.at("constraint").as_string().c_str(), "skill_eligibility");
}

UTEST(wos, scenarios) {
  WOS wos(test_options());
  std::vector<Scenario> scenarios;
  Scenario ok;
  ok.name = "day_shift";
  ok.wave = data::codec::wave_from_json(make_batch(5));
  scenarios.push_back(ok);
  Scenario no_label;
  no_label.name = "no_label";
  no_label.wave = data::codec::wave_from_json(make_batch(5, false));
  scenarios.push_back(no_label);
  Scenario fast;
  fast.name = "fast";
  fast.wave = ok.wave;
  fast.options = test_options();
  fast.options->solver.max_iterations = 2;
  scenarios.push_back(fast);
  auto out = wos.run_scenarios(scenarios);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_STREQ(out[0].name.c_str(), "day_shift");
  EXPECT_EQ(out[0].code, 200);
  ASSERT_TRUE(out[0].result.has_value());
  EXPECT_EQ(out[0].result->plan.orders.size(), 5u);
  EXPECT_EQ(out[1].code, 422);
  EXPECT_FALSE(out[1].result.has_value());
  EXPECT_STREQ(out[1].error.at("stage").as_string().c_str(), "LABEL");
  EXPECT_EQ(out[2].code, 200);
  ASSERT_TRUE(out[2].result.has_value());
  EXPECT_EQ(out[2].result->iterations, 2u);
  EXPECT_TRUE(out[0].result->run != out[2].result->run);
}

UTEST(wos, cancel_running) {
  auto wos = std::make_shared<WOS>(test_options());
  auto opt = test_options();
  opt.solver.max_iterations = 0;
  auto wave = data::codec::wave_from_json(make_batch(12));
  RunResult r;
  std::thread th{[&r, &opt, &wave, wos] { r = wos->run(wave, opt, std::nullopt); }};
  for (int i = 0; i < 200 && wos->running() == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  wos->cancel();
  th.join();
  EXPECT_TRUE(r.cancelled);
  EXPECT_TRUE(r.budget_exhausted);
  EXPECT_FALSE(r.exact);
  EXPECT_EQ(wos->running(), 0u);
}

UTEST(wos, cancel_while_building) {
  auto wos = std::make_shared<WOS>(test_options());
  auto opt = test_options();
  opt.solver.max_iterations = 0;
  auto wave = data::codec::wave_from_json(make_batch(12));
  RunResult r;
  std::thread th{[&r, &opt, &wave, wos] { r = wos->run(wave, opt, std::nullopt); }};
  // 运行一开始即登记, 此时多半仍在构建问题
  while (wos->running() == 0) {
    std::this_thread::yield();
  }
  wos->cancel();
  th.join();
  EXPECT_TRUE(r.cancelled);
  EXPECT_TRUE(r.budget_exhausted);
  EXPECT_FALSE(r.exact);
  if (!r.plan.complete) {
    EXPECT_TRUE(std::isinf(r.objective));
    EXPECT_TRUE(r.to_json().at("objective").is_null());
  }
  EXPECT_EQ(wos->running(), 0u);

  // 没有运行时的取消不影响之后的运行
  wos->cancel();
  auto next = wos->run(wave, test_options(), std::nullopt);
  EXPECT_FALSE(next.cancelled);
  EXPECT_TRUE(next.plan.complete);
}

UTEST(options, parse) {
  auto opt = parse_options(R"(
log:
  level: warn
  to_stdout: false
optimizer:
  time_budget_ms: 0
  max_iterations: 7
  order_limit: 3
  seed: 7
weights:
  tardiness: 3.5
  priority_factors:
    - 4
    - 3
  premium_factor: 1.5
standard_times:
  pick_per_item: 1.5
  rush_priority: 1
cost:
  default_hourly_rate: 30
)");
  EXPECT_STREQ(opt.log.level.c_str(), "warn");
  EXPECT_FALSE(opt.log.to_stdout);
  EXPECT_TRUE(opt.log.enable);
  EXPECT_EQ(opt.solver.time_budget.count(), 0);
  EXPECT_EQ(opt.solver.max_iterations, 7u);
  EXPECT_EQ(opt.order_limit, 3u);
  EXPECT_EQ(opt.solver.seed, 7u);
  EXPECT_EQ(opt.solver.weights.tardiness, 3.5);
  EXPECT_EQ(opt.solver.weights.makespan, 1.0);
  EXPECT_EQ(opt.solver.weights.priority_factors[0], 4.0);
  EXPECT_EQ(opt.solver.weights.priority_factors[1], 3.0);
  EXPECT_EQ(opt.solver.weights.priority_factors[2], 2.0);
  EXPECT_EQ(opt.solver.weights.premium_factor, 1.5);
  EXPECT_EQ(opt.durations.pick_per_item, 1.5);
  EXPECT_EQ(opt.durations.rush_priority, 1);
  EXPECT_EQ(opt.default_hourly_rate, 30.0);
  EXPECT_EQ(opt.horizon_minutes, 1440);
}

UTEST(options, need_a_bound) {
  auto opt = parse_options(R"(
optimizer:
  time_budget_ms: 0
  max_iterations: 0
)");
  EXPECT_EQ(opt.solver.time_budget.count(), 10000);
}

UTEST(options, config_file) {
  auto opt = read_options("config/config.yaml");
  EXPECT_EQ(opt.solver.time_budget.count(), 10000);
  EXPECT_EQ(opt.solver.max_candidates, 6);
  EXPECT_EQ(opt.durations.ship_rush_factor, 0.8);
  EXPECT_EQ(opt.max_batch_size, 500u);
  EXPECT_STREQ(opt.durations.powered_pick_kind.c_str(), "powered_pick_cart");
  EXPECT_EQ(opt.solver.weights.priority_factors[4], 1.0);
}

UTEST_STATE();
int main(int argc, const char* const argv[]) {
  el::Loggers::addFlag(el::LoggingFlag::CreateLoggerAutomatically);
  return utest_main(argc, argv);
}
