#include <utest.h>

#include <fstream>

#include "../../../include/component/data/codec.hpp"

INITIALIZE_EASYLOGGINGPP

static const char* kBatch = R"({
  "waveStart": "2026-10-19T08:00:00Z",
  "orders": [
    {"orderId": "O1", "priority": 1, "deadline": "2026-10-19T10:00:00Z",
     "itemCount": 4, "totalWeight": 5.0, "customerType": "premium",
     "walkingMinutes": 2.5},
    {"orderId": "O2", "priority": 3, "deadline": "2026-10-19T09:30:30Z",
     "itemCount": 2, "pickMinutes": 6.5}
  ],
  "workers": [
    {"workerId": "W1", "capabilities": ["PICK", "PACK"], "hourlyRate": 22.5,
     "efficiency": 1.25},
    {"workerId": "W2", "capabilities": ["CONSOLIDATE", "LABEL", "STAGE", "SHIP"]}
  ],
  "equipment": [
    {"equipmentId": "C1", "stage": "PICK"},
    {"equipmentId": "P1", "stage": "PACK", "kind": "auto_bagger",
     "hourlyCost": 4.0},
    {"equipmentId": "D1", "stage": "SHIP", "efficiency": 0.8}
  ]
})";

UTEST(wave, decode) {
  auto wave = data::codec::parse_wave(kBatch);
  auto start = get_time_from_str("2026-10-19T08:00:00Z").value();
  EXPECT_TRUE(wave.start == start);
  ASSERT_EQ(wave.orders.size(), 2u);
  auto& o1 = wave.orders[0];
  EXPECT_STREQ(o1->name.c_str(), "O1");
  EXPECT_EQ(o1->priority.value(), 1);
  EXPECT_EQ(minutes_between(start, o1->deadline.value()), 120);
  EXPECT_EQ(o1->item_count, 4);
  EXPECT_TRUE(o1->premium());
  EXPECT_EQ(o1->walking_minutes, 2.5);
  auto& o2 = wave.orders[1];
  EXPECT_EQ(minutes_between(start, o2->deadline.value()), 90);
  EXPECT_EQ(o2->pick_minutes, 6.5);
  EXPECT_EQ(o2->total_weight, 0.0);
  EXPECT_STREQ(o2->customer_type.c_str(), "standard");
  EXPECT_FALSE(o2->premium());
  EXPECT_EQ(o2->walking_minutes, 0.0);

  ASSERT_EQ(wave.workers.size(), 2u);
  EXPECT_TRUE(wave.workers[0]->can_do(data::model::StageType::PACK));
  EXPECT_FALSE(wave.workers[0]->can_do(data::model::StageType::SHIP));
  EXPECT_EQ(wave.workers[0]->hourly_rate.value(), 22.5);
  EXPECT_EQ(wave.workers[0]->efficiency, 1.25);
  EXPECT_FALSE(wave.workers[1]->hourly_rate.has_value());
  EXPECT_EQ(wave.workers[1]->efficiency, 1.0);

  ASSERT_EQ(wave.equipment.size(), 3u);
  EXPECT_STREQ(wave.equipment[0]->kind.c_str(), "pick_cart");
  EXPECT_STREQ(wave.equipment[1]->kind.c_str(), "auto_bagger");
  EXPECT_EQ(wave.equipment[1]->hourly_cost, 4.0);
  EXPECT_TRUE(wave.equipment[2]->stage == data::model::StageType::SHIP);
  EXPECT_EQ(wave.equipment[2]->efficiency, 0.8);
}

UTEST(wave, missing_fields_stay_empty) {
  auto wave = data::codec::parse_wave(R"({
    "waveStart": "2026-10-19T08:00:00Z",
    "orders": [{"orderId": "O1", "itemCount": 3}],
    "workers": [], "equipment": []})");
  ASSERT_EQ(wave.orders.size(), 1u);
  EXPECT_FALSE(wave.orders[0]->priority.has_value());
  EXPECT_FALSE(wave.orders[0]->deadline.has_value());
}

UTEST(wave, reject_bad_json) {
  EXPECT_EXCEPTION(data::codec::parse_wave("{\"waveStart\": "),
                   error::InvalidInput);
}

UTEST(wave, reject_schema_violation) {
  std::vector<std::string> details;
  try {
    data::codec::parse_wave(R"({
      "waveStart": "2026-10-19T08:00:00Z",
      "orders": [{"orderId": "O1", "itemCount": -2}],
      "workers": [{"workerId": "W1"}],
      "equipment": [{"equipmentId": "E1", "stage": "SORT"}]})");
  } catch (error::InvalidInput& ec) {
    details = ec.details();
  }
  // itemCount, capabilities, stage 各一处
  EXPECT_GE(details.size(), 3u);
  for (auto& d : details) {
    EXPECT_EQ(d.rfind("batch ", 0), 0u);
  }
}

UTEST(wave, reject_unknown_customer_type) {
  std::vector<std::string> details;
  try {
    data::codec::parse_wave(R"({
      "waveStart": "2026-10-19T08:00:00Z",
      "orders": [{"orderId": "O1", "customerType": "vip",
                  "walkingMinutes": -1}],
      "workers": [], "equipment": []})");
  } catch (error::InvalidInput& ec) {
    details = ec.details();
  }
  EXPECT_GE(details.size(), 2u);
}

UTEST(wave, reject_non_object_document) {
  std::vector<std::string> details;
  try {
    data::codec::parse_wave("[1, 2]");
  } catch (error::InvalidInput& ec) {
    details = ec.details();
  }
  ASSERT_EQ(details.size(), 1u);
  EXPECT_EQ(details[0].rfind("batch", 0), 0u);
}

UTEST(wave, reject_bad_timestamp) {
  EXPECT_EXCEPTION(data::codec::parse_wave(R"({
      "waveStart": "2026-10-19 08:00",
      "orders": [], "workers": [], "equipment": []})"),
                   error::InvalidInput);
  std::vector<std::string> details;
  try {
    data::codec::parse_wave(R"({
      "waveStart": "2026-10-19T08:00:00Z",
      "orders": [{"orderId": "O1", "priority": 1, "deadline": "tomorrow"},
                 {"orderId": "O2", "priority": 1, "deadline": "noon"}],
      "workers": [], "equipment": []})");
  } catch (error::InvalidInput& ec) {
    details = ec.details();
  }
  EXPECT_EQ(details.size(), 2u);
}

UTEST(wave, sample_file) {
  std::ifstream in("data/batch_sample.json");
  ASSERT_TRUE(in.is_open());
  std::stringstream ss;
  ss << in.rdbuf();
  auto wave = data::codec::parse_wave(ss.str());
  EXPECT_EQ(wave.orders.size(), 12u);
  EXPECT_EQ(wave.workers.size(), 8u);
  EXPECT_EQ(wave.equipment.size(), 9u);
}

static data::plan::Plan make_plan() {
  data::plan::Plan p;
  p.run = "Run_test";
  p.wave_start = get_time_from_str("2026-10-19T08:00:00Z").value();
  data::plan::OrderPlan o;
  o.order_id = "O1";
  o.priority = 2;
  o.deadline = 30;
  data::plan::StageInstance pick;
  pick.stage = data::model::StageType::PICK;
  pick.start = 5;
  pick.duration = 10;
  pick.waiting = 5;
  pick.worker = "W1";
  pick.equipment = "C1";
  data::plan::StageInstance cons;
  cons.stage = data::model::StageType::CONSOLIDATE;
  cons.start = 20;
  cons.duration = 15;
  cons.waiting = 5;
  cons.worker = "W2";
  o.stages = {pick, cons};
  o.total_processing_time = 25;
  o.total_waiting_time = 10;
  o.total_time = 35;
  o.tardiness = 5;
  p.orders.push_back(o);
  p.makespan = 35;
  return p;
}

UTEST(plan, encode) {
  auto doc = data::codec::plan_to_json(make_plan());
  EXPECT_STREQ(doc.at("waveStart").as_string().c_str(),
               "2026-10-19T08:00:00.000Z");
  EXPECT_EQ(doc.at("makespan").as<int>(), 35);
  EXPECT_TRUE(doc.at("complete").as<bool>());
  auto& order = doc.at("orders")[0];
  EXPECT_EQ(order.at("deadline").as<int>(), 30);
  EXPECT_EQ(order.at("tardiness").as<int>(), 5);
  auto& stages = order.at("stages");
  ASSERT_EQ(stages.size(), 2u);
  EXPECT_STREQ(stages[0].at("stage").as_string().c_str(), "PICK");
  EXPECT_STREQ(stages[0].at("startTime").as_string().c_str(),
               "2026-10-19T08:05:00.000Z");
  EXPECT_STREQ(stages[0].at("equipment").as_string().c_str(), "C1");
  EXPECT_TRUE(stages[1].at("equipment").is_null());
}

UTEST(plan, decode_recomputes_aggregates) {
  auto p = data::codec::parse_plan(R"({
    "waveStart": "2026-10-19T08:00:00Z",
    "orders": [{
      "orderId": "O1", "priority": 3, "deadline": 20,
      "stages": [
        {"stage": "PICK", "start": 0, "duration": 8, "worker": "W1",
         "equipment": "C1"},
        {"stage": "CONSOLIDATE", "start": 12, "duration": 4, "worker": "W1"},
        {"stage": "PACK", "start": 16, "duration": 6, "waiting": 0,
         "worker": "W2", "equipment": null}
      ]}],
    "unscheduled": ["O9"]})");
  ASSERT_EQ(p.orders.size(), 1u);
  auto& o = p.orders[0];
  EXPECT_EQ(o.stages[0].waiting, 0);
  EXPECT_EQ(o.stages[1].waiting, 4);
  EXPECT_FALSE(o.stages[2].equipment.has_value());
  EXPECT_EQ(o.total_processing_time, 18);
  EXPECT_EQ(o.total_waiting_time, 4);
  EXPECT_EQ(o.total_time, 22);
  EXPECT_EQ(o.tardiness, 2);
  EXPECT_EQ(p.makespan, 22);
  EXPECT_FALSE(p.complete);
  ASSERT_EQ(p.unscheduled.size(), 1u);
}

UTEST(plan, encode_then_decode_orders) {
  auto src = make_plan();
  auto back = data::codec::plan_from_json(data::codec::plan_to_json(src));
  EXPECT_TRUE(back.orders == src.orders);
  EXPECT_TRUE(back.wave_start == src.wave_start);
  EXPECT_EQ(back.makespan, src.makespan);
}

UTEST(plan, reject_negative_start) {
  EXPECT_EXCEPTION(data::codec::parse_plan(R"({
    "waveStart": "2026-10-19T08:00:00Z",
    "orders": [{"orderId": "O1", "stages": [
      {"stage": "PICK", "start": -3, "duration": 8, "worker": "W1"}]}]})"),
                   error::InvalidInput);
  std::vector<std::string> details;
  try {
    data::codec::parse_plan(R"({
      "waveStart": "2026-10-19T08:00:00Z",
      "orders": [{"orderId": "O1", "stages": [
        {"stage": "PICK", "start": -3, "duration": 8, "worker": "W1"}]}]})");
  } catch (error::InvalidInput& ec) {
    details = ec.details();
  }
  ASSERT_FALSE(details.empty());
  EXPECT_EQ(details[0].rfind("plan ", 0), 0u);
}

UTEST_STATE();
int main(int argc, const char* const argv[]) {
  el::Loggers::addFlag(el::LoggingFlag::CreateLoggerAutomatically);
  return utest_main(argc, argv);
}
