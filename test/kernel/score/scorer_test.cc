#include <utest.h>

#include "../../../include/kernel/planner/solver.hpp"

INITIALIZE_EASYLOGGINGPP
using data::model::StageType;
static const auto kStart = get_time_from_str("2026-10-19T08:00:00Z").value();

static data::plan::StageInstance make_stage(StageType t, int start, int dur,
                                            int waiting,
                                            const std::string& worker,
                                            std::optional<std::string> eq) {
  data::plan::StageInstance s;
  s.stage = t;
  s.start = start;
  s.duration = dur;
  s.waiting = waiting;
  s.worker = worker;
  s.equipment = std::move(eq);
  return s;
}

static data::plan::Plan make_plan() {
  data::plan::Plan p;
  p.wave_start = kStart;
  data::plan::OrderPlan o;
  o.order_id = "O1";
  o.priority = 1;
  o.deadline = 60;
  o.stages.push_back(make_stage(StageType::PICK, 0, 30, 0, "W1", "C1"));
  o.stages.push_back(make_stage(StageType::PACK, 40, 30, 10, "W1", std::nullopt));
  p.orders.push_back(o);
  p.makespan = 70;
  return p;
}

UTEST(scorer, breakdown) {
  kernel::score::Scorer scorer("scorer", kernel::score::Weights{}, nullptr);
  scorer.equipment_costs["C1"] = 6;
  auto b = scorer.score(make_plan());
  EXPECT_EQ(b.orders, 1);
  EXPECT_EQ(b.makespan, 70);
  EXPECT_EQ(b.tardiness, 10);
  EXPECT_NEAR(b.weighted_tardiness, 30.0, 1e-9);  // 优先级 1
  EXPECT_EQ(b.tardy_orders, 1);
  EXPECT_NEAR(b.on_time_rate, 0.0, 1e-9);
  EXPECT_NEAR(b.labor_cost, 25.0, 1e-9);
  EXPECT_NEAR(b.equipment_cost, 3.0, 1e-9);
  EXPECT_EQ(b.idle, 10);
  EXPECT_EQ(b.total_time, 70);
  EXPECT_EQ(b.total_processing, 60);
  EXPECT_EQ(b.total_waiting, 10);
  EXPECT_EQ(b.stage_duration[data::model::stage_index(StageType::PACK)], 30);
  EXPECT_TRUE(b.bottleneck == StageType::PACK);
  EXPECT_NEAR(b.bottleneck_wait, 10.0, 1e-9);
  // 70 + 10 * 30 + 0.1 * 28 + 0.05 * 10
  EXPECT_NEAR(b.objective, 373.3, 1e-9);
  EXPECT_NEAR(scorer.objective(b), b.objective, 1e-9);
  auto doc = b.to_json();
  EXPECT_STREQ(doc.at("bottleneck").as_string().c_str(), "PACK");
  EXPECT_EQ(doc.at("stages").size(), 6u);
}

UTEST(scorer, rates_and_weights) {
  kernel::score::Weights w;
  w.makespan = 0;
  w.tardiness = 0;
  w.cost = 1;
  w.idle = 0;
  kernel::score::Scorer scorer("scorer", w, nullptr);
  scorer.worker_rates["W1"] = 60;
  auto b = scorer.score(make_plan());
  EXPECT_NEAR(b.labor_cost, 60.0, 1e-9);
  EXPECT_NEAR(b.objective, 60.0, 1e-9);
}

UTEST(scorer, deadline_override) {
  kernel::score::Scorer scorer("scorer", kernel::score::Weights{}, nullptr);
  scorer.deadlines["O1"] = 80;
  auto b = scorer.score(make_plan());
  EXPECT_EQ(b.tardiness, 0);
  EXPECT_NEAR(b.on_time_rate, 100.0, 1e-9);
}

UTEST(scorer, empty_plan) {
  kernel::score::Scorer scorer("scorer", kernel::score::Weights{}, nullptr);
  auto b = scorer.score(data::plan::Plan{});
  EXPECT_EQ(b.orders, 0);
  EXPECT_EQ(b.objective, 0.0);
}

UTEST(scorer, improvement) {
  EXPECT_NEAR(kernel::score::improvement(100, 80), 20.0, 1e-9);
  EXPECT_NEAR(kernel::score::improvement(100, 120), -20.0, 1e-9);
  EXPECT_EQ(kernel::score::improvement(0, 5), 0.0);
}

static kernel::problem::ProblemPtr make_problem(int orders) {
  data::model::Wave wave;
  wave.start = kStart;
  for (int i = 0; i < orders; i++) {
    auto o = std::make_shared<data::model::Order>("O" + std::to_string(i + 1));
    o->priority = 1 + i % 5;
    o->deadline = kStart + std::chrono::minutes(60 + 15 * i);
    o->item_count = 3 + i % 4;
    o->total_weight = 4.0 * (i % 6);
    wave.orders.push_back(o);
  }
  for (int i = 0; i < 4; i++) {
    auto w = std::make_shared<data::model::Worker>("W" + std::to_string(i + 1));
    w->capabilities = {StageType::PICK,  StageType::CONSOLIDATE,
                       StageType::PACK,  StageType::LABEL,
                       StageType::STAGE, StageType::SHIP};
    w->hourly_rate = 20 + i;
    wave.workers.push_back(w);
  }
  for (auto& s : {StageType::PICK, StageType::PACK, StageType::SHIP}) {
    for (int i = 0; i < 2; i++) {
      auto e = std::make_shared<data::model::Equipment>(
          data::model::get_stage_name(s) + "_" + std::to_string(i + 1));
      e->stage = s;
      e->hourly_cost = 2;
      wave.equipment.push_back(e);
    }
  }
  kernel::problem::ProblemBuilder builder("builder");
  return builder.build(wave);
}

// 人工排班: 所有订单由第一名员工逐个串行完成
static data::plan::Plan serial_plan(const kernel::problem::ProblemPtr& p) {
  data::plan::Plan plan;
  plan.wave_start = p->wave_start;
  int now{0};
  for (auto& o : p->orders) {
    data::plan::OrderPlan op;
    op.order_id = o.order->name;
    op.priority = o.priority;
    op.deadline = o.deadline;
    for (auto& id : o.tasks) {
      auto& t = p->tasks[id];
      std::optional<std::string> eq;
      int e = t.equipment.empty() ? -1 : t.equipment.front();
      if (e >= 0) {
        eq = p->equipment[e]->name;
      }
      auto d = p->effective_duration(t, 0, e);
      op.stages.push_back(make_stage(t.stage, now, d, 0, "W1", eq));
      now += d;
    }
    op.total_time = now;
    plan.orders.push_back(op);
  }
  plan.makespan = now;
  return plan;
}

UTEST(scorer, tardiness_weighted_by_priority_and_customer) {
  kernel::score::Weights w;
  EXPECT_EQ(w.tardiness_factor(1, false), 3.0);
  EXPECT_EQ(w.tardiness_factor(3, false), 2.0);
  EXPECT_EQ(w.tardiness_factor(5, false), 1.0);
  EXPECT_EQ(w.tardiness_factor(2, true), 6.0);

  data::model::Wave wave;
  wave.start = kStart;
  auto vip = std::make_shared<data::model::Order>("O1");
  vip->priority = 1;
  vip->deadline = kStart;
  vip->item_count = 4;
  vip->customer_type = "premium";
  auto low = std::make_shared<data::model::Order>("O2");
  low->priority = 5;
  low->deadline = kStart;
  low->item_count = 4;
  wave.orders = {vip, low};
  auto worker = std::make_shared<data::model::Worker>("W1");
  worker->capabilities = {StageType::PICK,  StageType::CONSOLIDATE,
                          StageType::PACK,  StageType::LABEL,
                          StageType::STAGE, StageType::SHIP};
  wave.workers.push_back(worker);
  for (auto& s : {StageType::PICK, StageType::PACK, StageType::SHIP}) {
    auto e = std::make_shared<data::model::Equipment>(
        data::model::get_stage_name(s));
    e->stage = s;
    wave.equipment.push_back(e);
  }
  kernel::problem::ProblemBuilder builder("builder");
  auto p = builder.build(wave);
  auto plan = serial_plan(p);
  ASSERT_EQ(plan.orders.size(), 2u);
  ASSERT_STREQ(plan.orders[0].order_id.c_str(), "O1");
  auto first = plan.orders[0].total_time;
  auto second = plan.orders[1].total_time;

  kernel::score::Scorer scorer("scorer", w, p);
  auto b = scorer.score(plan);
  EXPECT_EQ(b.tardiness, first + second);
  // premium 且优先级 1: 3 * 2, 优先级 5: 1
  EXPECT_NEAR(b.weighted_tardiness, 6.0 * first + second, 1e-9);
  EXPECT_NEAR(b.objective - scorer.objective(b), 0.0, 1e-9);
}

UTEST(scorer, compare_with_baseline) {
  auto p = make_problem(10);
  kernel::planner::SolverConfig cfg;
  cfg.time_budget = std::chrono::milliseconds(0);
  cfg.max_iterations = 20;
  kernel::planner::Solver solver("solver", p, cfg);
  auto r = solver.solve();
  ASSERT_TRUE(r.complete());
  kernel::planner::Extractor ex("extractor", p);
  auto optimized = ex.extract(r.assignment);
  kernel::score::Scorer scorer("scorer", cfg.weights, p);
  auto cmp = scorer.compare(optimized, serial_plan(p));
  EXPECT_EQ(cmp.optimized.orders, 10);
  EXPECT_EQ(cmp.baseline.orders, 10);
  EXPECT_GT(cmp.total_time_improvement, 0.0);
  EXPECT_GE(cmp.objective_improvement, 0.0);
  EXPECT_GT(cmp.makespan_improvement, 0.0);
  EXPECT_GE(cmp.tardy_orders_reduction, 0);
  EXPECT_NEAR(cmp.optimized.objective, r.objective, 1e-6);
  auto doc = cmp.to_json();
  EXPECT_TRUE(doc.contains("totalTimeImprovement"));
  EXPECT_TRUE(doc.at("baseline").contains("objective"));
}

UTEST_STATE();
int main(int argc, const char* const argv[]) {
  el::Loggers::addFlag(el::LoggingFlag::CreateLoggerAutomatically);
  return utest_main(argc, argv);
}
