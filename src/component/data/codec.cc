#include "../../../include/component/data/codec.hpp"

#include "../../../include/component/tools/json_validator/validator.hpp"
namespace data {
namespace codec {
static std::string batch_sch = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "batch",
    "description": "orders of one wave together with the resource pool snapshot.",
    "type": "object",
    "required": ["waveStart", "orders", "workers", "equipment"],
    "properties": {
        "waveStart": {
            "type": "string",
            "description": "UTC release time of the wave, all plan times are minute offsets from it."
        },
        "orders": {
            "type": "array",
            "items": {
                "type": "object",
                "required": ["orderId"],
                "properties": {
                    "orderId": {"type": "string", "minLength": 1},
                    "priority": {"type": "integer"},
                    "deadline": {"type": "string"},
                    "itemCount": {"type": "integer", "minimum": 0},
                    "totalWeight": {"type": "number", "minimum": 0},
                    "pickMinutes": {"type": "number", "minimum": 0},
                    "packMinutes": {"type": "number", "minimum": 0},
                    "walkingMinutes": {"type": "number", "minimum": 0},
                    "customerType": {"enum": ["standard", "premium"]}
                }
            }
        },
        "workers": {
            "type": "array",
            "items": {
                "type": "object",
                "required": ["workerId", "capabilities"],
                "properties": {
                    "workerId": {"type": "string", "minLength": 1},
                    "capabilities": {
                        "type": "array",
                        "items": {
                            "enum": ["PICK", "CONSOLIDATE", "PACK", "LABEL", "STAGE", "SHIP"]
                        }
                    },
                    "hourlyRate": {"type": "number", "minimum": 0},
                    "efficiency": {"type": "number", "exclusiveMinimum": 0}
                }
            }
        },
        "equipment": {
            "type": "array",
            "items": {
                "type": "object",
                "required": ["equipmentId", "stage"],
                "properties": {
                    "equipmentId": {"type": "string", "minLength": 1},
                    "stage": {
                        "enum": ["PICK", "CONSOLIDATE", "PACK", "LABEL", "STAGE", "SHIP"]
                    },
                    "kind": {"type": "string"},
                    "hourlyCost": {"type": "number", "minimum": 0},
                    "efficiency": {"type": "number", "exclusiveMinimum": 0}
                }
            }
        }
    }
}
  )";

static std::string plan_sch = R"(
{
    "$schema": "https://json-schema.org/draft/2020-12/schema",
    "title": "plan",
    "description": "per order, per stage timing and resource bindings.",
    "type": "object",
    "required": ["waveStart", "orders"],
    "properties": {
        "run": {"type": "string"},
        "waveStart": {"type": "string"},
        "orders": {
            "type": "array",
            "items": {
                "type": "object",
                "required": ["orderId", "stages"],
                "properties": {
                    "orderId": {"type": "string"},
                    "priority": {"type": "integer"},
                    "deadline": {"type": ["integer", "null"]},
                    "stages": {
                        "type": "array",
                        "items": {
                            "type": "object",
                            "required": ["stage", "start", "duration", "worker"],
                            "properties": {
                                "stage": {
                                    "enum": ["PICK", "CONSOLIDATE", "PACK", "LABEL", "STAGE", "SHIP"]
                                },
                                "start": {"type": "integer", "minimum": 0},
                                "duration": {"type": "integer", "minimum": 0},
                                "waiting": {"type": "integer", "minimum": 0},
                                "worker": {"type": "string"},
                                "equipment": {"type": ["string", "null"]}
                            }
                        }
                    }
                }
            }
        },
        "unscheduled": {"type": "array", "items": {"type": "string"}}
    }
}
  )";

static SchemaPtr batch_schema() {
  static auto ptr = jsoncons::jsonschema::make_schema(json::parse(batch_sch));
  return ptr;
}

static SchemaPtr plan_schema() {
  static auto ptr = jsoncons::jsonschema::make_schema(json::parse(plan_sch));
  return ptr;
}

static double number_or(const json& obj, const std::string& key,
                        double def) {
  if (obj.contains(key) && !obj.at(key).is_null()) {
    return obj.at(key).as<double>();
  }
  return def;
}

model::Wave wave_from_json(const json& doc) {
  auto errors = SchemaValidator::validate(doc, batch_schema(), "batch");
  if (!errors.empty()) {
    for (auto& e : errors) {
      CLOG(WARNING, builder_log) << e;
    }
    throw error::InvalidInput("batch document failed schema validation",
                              errors);
  }
  model::Wave wave;
  auto start = get_time_from_str(doc.at("waveStart").as_string());
  if (!start.has_value()) {
    throw error::InvalidInput("waveStart '" +
                              doc.at("waveStart").as_string() +
                              "' is not a UTC timestamp");
  }
  wave.start = start.value();

  std::vector<std::string> bad;
  for (auto& o : doc.at("orders").array_range()) {
    auto ord = std::make_shared<model::Order>(o.at("orderId").as_string());
    if (o.contains("priority")) {
      ord->priority = o.at("priority").as<int>();
    }
    if (o.contains("deadline")) {
      auto dt = get_time_from_str(o.at("deadline").as_string());
      if (dt.has_value()) {
        ord->deadline = dt;
      } else {
        bad.push_back("order '" + ord->name + "' deadline '" +
                      o.at("deadline").as_string() +
                      "' is not a UTC timestamp");
      }
    }
    ord->item_count = static_cast<int>(number_or(o, "itemCount", 0));
    ord->total_weight = number_or(o, "totalWeight", 0);
    ord->pick_minutes = number_or(o, "pickMinutes", 0);
    ord->pack_minutes = number_or(o, "packMinutes", 0);
    ord->walking_minutes = number_or(o, "walkingMinutes", 0);
    if (o.contains("customerType")) {
      ord->customer_type = o.at("customerType").as_string();
    }
    wave.orders.push_back(ord);
  }
  if (!bad.empty()) {
    throw error::InvalidInput("batch contains malformed orders", bad);
  }

  for (auto& w : doc.at("workers").array_range()) {
    auto worker =
        std::make_shared<model::Worker>(w.at("workerId").as_string());
    for (auto& c : w.at("capabilities").array_range()) {
      auto t = model::new_stage(c.as_string());
      if (t.has_value()) {
        worker->capabilities.insert(t.value());
      }
    }
    if (w.contains("hourlyRate")) {
      worker->hourly_rate = w.at("hourlyRate").as<double>();
    }
    worker->efficiency = number_or(w, "efficiency", 1.0);
    wave.workers.push_back(worker);
  }

  for (auto& e : doc.at("equipment").array_range()) {
    auto eq =
        std::make_shared<model::Equipment>(e.at("equipmentId").as_string());
    eq->stage = model::new_stage(e.at("stage").as_string()).value();
    eq->kind = e.contains("kind") ? e.at("kind").as_string()
                                  : model::equipment_kind(eq->stage);
    eq->hourly_cost = number_or(e, "hourlyCost", 0);
    eq->efficiency = number_or(e, "efficiency", 1.0);
    wave.equipment.push_back(eq);
  }
  CLOG(INFO, builder_log) << "decode batch: " << wave.orders.size()
                          << " orders, " << wave.workers.size()
                          << " workers, " << wave.equipment.size()
                          << " equipment";
  return wave;
}

model::Wave parse_wave(const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (jsoncons::ser_error& ec) {
    CLOG(ERROR, builder_log) << "parse error: " << ec.what();
    throw error::InvalidInput(std::string{"Could not parse JSON input: "} +
                              ec.what());
  }
  return wave_from_json(doc);
}

json usage_to_json(const plan::ResourceUsage& u) {
  json value;
  value["id"] = u.id;
  value["assignments"] = u.assignments;
  value["busy"] = u.busy;
  value["firstStart"] = u.first_start;
  value["lastEnd"] = u.last_end;
  value["idle"] = u.idle;
  value["utilization"] = u.utilization;
  return value;
}

json plan_to_json(const plan::Plan& p) {
  json res;
  res["run"] = p.run;
  res["waveStart"] = get_time_fmt_utc(p.wave_start);
  res["complete"] = p.complete;
  res["makespan"] = p.makespan;
  res["orders"] = json::array();
  for (auto& o : p.orders) {
    json value;
    value["orderId"] = o.order_id;
    value["priority"] = o.priority;
    if (o.deadline.has_value()) {
      value["deadline"] = o.deadline.value();
    } else {
      value["deadline"] = json::null();
    }
    value["stages"] = json::array();
    for (auto& s : o.stages) {
      json st;
      st["stage"] = model::get_stage_name(s.stage);
      st["start"] = s.start;
      st["duration"] = s.duration;
      st["waiting"] = s.waiting;
      st["startTime"] =
          get_time_fmt_utc(p.wave_start + std::chrono::minutes(s.start));
      st["worker"] = s.worker;
      if (s.equipment.has_value()) {
        st["equipment"] = s.equipment.value();
      } else {
        st["equipment"] = json::null();
      }
      value["stages"].push_back(st);
    }
    value["totalProcessingTime"] = o.total_processing_time;
    value["totalWaitingTime"] = o.total_waiting_time;
    value["totalTime"] = o.total_time;
    value["tardiness"] = o.tardiness;
    res["orders"].push_back(value);
  }
  res["unscheduled"] = json::array();
  for (auto& u : p.unscheduled) {
    res["unscheduled"].push_back(u);
  }
  res["workers"] = json::array();
  for (auto& u : p.workers) {
    res["workers"].push_back(usage_to_json(u));
  }
  res["equipment"] = json::array();
  for (auto& u : p.equipment) {
    res["equipment"].push_back(usage_to_json(u));
  }
  return res;
}

plan::Plan plan_from_json(const json& doc) {
  auto errors = SchemaValidator::validate(doc, plan_schema(), "plan");
  if (!errors.empty()) {
    throw error::InvalidInput("plan document failed schema validation",
                              errors);
  }
  plan::Plan p;
  auto start = get_time_from_str(doc.at("waveStart").as_string());
  if (!start.has_value()) {
    throw error::InvalidInput("waveStart '" +
                              doc.at("waveStart").as_string() +
                              "' is not a UTC timestamp");
  }
  p.wave_start = start.value();
  if (doc.contains("run")) {
    p.run = doc.at("run").as_string();
  }
  for (auto& o : doc.at("orders").array_range()) {
    plan::OrderPlan op;
    op.order_id = o.at("orderId").as_string();
    if (o.contains("priority")) {
      op.priority = o.at("priority").as<int>();
    }
    if (o.contains("deadline") && !o.at("deadline").is_null()) {
      op.deadline = o.at("deadline").as<int>();
    }
    int prev_end{0};
    for (auto& s : o.at("stages").array_range()) {
      plan::StageInstance st;
      st.stage = model::new_stage(s.at("stage").as_string()).value();
      st.start = s.at("start").as<int>();
      st.duration = s.at("duration").as<int>();
      st.waiting = s.contains("waiting") ? s.at("waiting").as<int>()
                                         : std::max(0, st.start - prev_end);
      st.worker = s.at("worker").as_string();
      if (s.contains("equipment") && !s.at("equipment").is_null()) {
        st.equipment = s.at("equipment").as_string();
      }
      prev_end = st.end();
      op.total_processing_time += st.duration;
      op.total_waiting_time += st.waiting;
      op.stages.push_back(st);
    }
    op.total_time = prev_end;
    if (op.deadline.has_value()) {
      op.tardiness = std::max(0, op.total_time - op.deadline.value());
    }
    p.makespan = std::max(p.makespan, op.total_time);
    p.orders.push_back(op);
  }
  if (doc.contains("unscheduled")) {
    for (auto& u : doc.at("unscheduled").array_range()) {
      p.unscheduled.push_back(u.as_string());
    }
  }
  p.complete = p.unscheduled.empty();
  return p;
}

plan::Plan parse_plan(const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (jsoncons::ser_error& ec) {
    CLOG(ERROR, builder_log) << "parse error: " << ec.what();
    throw error::InvalidInput(std::string{"Could not parse JSON input: "} +
                              ec.what());
  }
  return plan_from_json(doc);
}
}  // namespace codec
}  // namespace data
