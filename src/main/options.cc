#include "../../include/main/options.hpp"

#include <Yaml.hpp>

template <typename T>
static void read_value(Yaml::Node& node, T& value) {
  if (!node.IsNone()) {
    value = node.As<T>();
  }
}

void load_options(Yaml::Node& root, Options& opt) {
  auto& log = root["log"];
  read_value(log["enable"], opt.log.enable);
  read_value(log["level"], opt.log.level);
  read_value(log["to_file"], opt.log.to_file);
  read_value(log["to_stdout"], opt.log.to_stdout);
  read_value(log["path"], opt.log.path);
  read_value(log["fmt"], opt.log.fmt);
  read_value(log["size"], opt.log.size);
  read_value(log["max_num"], opt.log.max_num);

  auto& optimizer = root["optimizer"];
  if (!optimizer["time_budget_ms"].IsNone()) {
    opt.solver.time_budget =
        std::chrono::milliseconds(optimizer["time_budget_ms"].As<int>());
  }
  if (!optimizer["max_iterations"].IsNone()) {
    opt.solver.max_iterations = optimizer["max_iterations"].As<uint64_t>();
  }
  read_value(optimizer["horizon_minutes"], opt.horizon_minutes);
  read_value(optimizer["max_batch_size"], opt.max_batch_size);
  read_value(optimizer["order_limit"], opt.order_limit);
  read_value(optimizer["max_candidates"], opt.solver.max_candidates);
  read_value(optimizer["seed"], opt.solver.seed);
  read_value(optimizer["initial_temperature"],
             opt.solver.initial_temperature);
  read_value(optimizer["cooling_rate"], opt.solver.cooling_rate);
  read_value(optimizer["target_gap"], opt.solver.target_gap);

  auto& weights = root["weights"];
  read_value(weights["makespan"], opt.solver.weights.makespan);
  read_value(weights["tardiness"], opt.solver.weights.tardiness);
  read_value(weights["cost"], opt.solver.weights.cost);
  read_value(weights["idle"], opt.solver.weights.idle);
  read_value(weights["premium_factor"], opt.solver.weights.premium_factor);
  auto& factors = weights["priority_factors"];
  if (factors.IsSequence()) {
    auto& dst = opt.solver.weights.priority_factors;
    for (size_t i = 0; i < factors.Size() && i < dst.size(); i++) {
      read_value(factors[i], dst[i]);
    }
  }

  auto& times = root["standard_times"];
  auto& d = opt.durations;
  read_value(times["pick_per_item"], d.pick_per_item);
  read_value(times["pick_rush_factor"], d.pick_rush_factor);
  read_value(times["pick_heavy_weight"], d.pick_heavy_weight);
  read_value(times["pick_heavy_factor"], d.pick_heavy_factor);
  read_value(times["powered_pick_kind"], d.powered_pick_kind);
  read_value(times["consolidate_per_item"], d.consolidate_per_item);
  read_value(times["consolidate_threshold"], d.consolidate_threshold);
  read_value(times["consolidate_extra_per_item"],
             d.consolidate_extra_per_item);
  read_value(times["pack_per_item"], d.pack_per_item);
  read_value(times["pack_heavy_weight"], d.pack_heavy_weight);
  read_value(times["pack_heavy_factor"], d.pack_heavy_factor);
  read_value(times["label_per_order"], d.label_per_order);
  read_value(times["label_threshold"], d.label_threshold);
  read_value(times["label_extra_per_item"], d.label_extra_per_item);
  read_value(times["stage_per_order"], d.stage_per_order);
  read_value(times["stage_heavy_weight"], d.stage_heavy_weight);
  read_value(times["stage_heavy_extra"], d.stage_heavy_extra);
  read_value(times["ship_per_order"], d.ship_per_order);
  read_value(times["ship_rush_factor"], d.ship_rush_factor);
  read_value(times["rush_priority"], d.rush_priority);

  read_value(root["cost"]["default_hourly_rate"], opt.default_hourly_rate);

  if (opt.solver.time_budget.count() <= 0 &&
      opt.solver.max_iterations == 0) {
    CLOG(WARNING, wos_log)
        << "neither time budget nor iteration cap is set, use 10000ms";
    opt.solver.time_budget = std::chrono::milliseconds(10000);
  }
}

Options read_options(const std::string& path) {
  Options opt;
  try {
    Yaml::Node root;
    Yaml::Parse(root, path.c_str());
    load_options(root, opt);
    CLOG(INFO, wos_log) << "read yaml param success\n";
  } catch (Yaml::Exception& ec) {
    CLOG(ERROR, wos_log) << "load param from <" << path << "> failed :"
                         << " " << ec.Message() << ", will use default params.";
    opt = Options{};
  }
  return opt;
}

Options parse_options(const std::string& text) {
  Options opt;
  try {
    Yaml::Node root;
    Yaml::Parse(root, text);
    load_options(root, opt);
  } catch (Yaml::Exception& ec) {
    CLOG(ERROR, wos_log) << "parse param failed: " << ec.Message()
                         << ", will use default params.";
    opt = Options{};
  }
  return opt;
}
