#ifndef WOS_HPP
#define WOS_HPP
#include <thread>

#include "../component/data/codec.hpp"
#include "./options.hpp"
using json = jsoncons::json;
using RET = std::pair<int, std::string>;
enum StatusCode {
  OK_200 = 200,
  BadRequest_400 = 400,
  UnprocessableEntity_422 = 422,
  InternalServerError_500 = 500,
};

struct RunResult {
  std::string run;
  data::plan::Plan plan;
  kernel::score::Breakdown score;
  std::optional<kernel::score::Comparison> comparison;
  kernel::planner::Solver::State state{
      kernel::planner::Solver::State::UNASSIGNED};
  bool exact{false};  // 完整可行且未因预算中止
  bool budget_exhausted{false};
  bool cancelled{false};
  double objective{0};  // 未得到完整计划时为正无穷, 输出为 null
  double partial_objective{0};
  double lower_bound{0};
  double optimality_gap{1.0};
  uint64_t iterations{0};
  std::chrono::milliseconds elapsed{0};
  std::vector<std::string> deferred;  // 超出订单数限制, 留给下一波次
  json to_json() const;
};

struct Scenario {
  std::string name;
  data::model::Wave wave;
  std::optional<data::plan::Plan> baseline;
  std::optional<Options> options;  // 为空时使用 WOS::options
};

struct ScenarioOutcome {
  std::string name;
  int code{OK_200};
  std::optional<RunResult> result;
  json error;
};

/**
 * @brief 波次优化的入口, 一次调用对应一次独立求解
 *
 */
class WOS : public std::enable_shared_from_this<WOS> {
 public:
  WOS() = default;
  explicit WOS(Options opt) : options(std::move(opt)) {}
  RunResult run(const data::model::Wave& wave,
                const std::optional<data::plan::Plan>& baseline =
                    std::nullopt);
  RunResult run(const data::model::Wave& wave, const Options& opt,
                const std::optional<data::plan::Plan>& baseline);
  // 各场景在独立线程上运行, 结果按输入顺序返回
  std::vector<ScenarioOutcome> run_scenarios(const std::vector<Scenario>&);
  // body: {"batch": {...}, "baseline": {...}, "config": {...}}
  RET post_optimization(const std::string& body);
  // 取消所有已开始的运行, 各自返回当前最优解; 尚在构建问题的运行在开始求解前取消
  void cancel();
  size_t running() const;

 public:
  Options options;
  event::PublisherPtr publisher;

 private:
  ScenarioOutcome run_scenario(const Scenario&);
  Options override_options(const json& cfg) const;
  static data::model::Wave limit_orders(const data::model::Wave& wave,
                                        size_t limit,
                                        std::vector<std::string>& deferred);

 private:
  struct ActiveRun {
    std::weak_ptr<kernel::planner::Solver> solver;  // 构建问题期间为空
    bool cancel_pending{false};
  };
  mutable std::mutex mut;
  std::map<std::string, ActiveRun> active;
};
#endif
