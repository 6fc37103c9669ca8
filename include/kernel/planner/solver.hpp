#ifndef SOLVER_HPP
#define SOLVER_HPP
#include <atomic>

#include "../../component/event/publisher.hpp"
#include "../score/scorer.hpp"
#include "./extractor.hpp"
namespace kernel {
namespace planner {
struct SolverConfig {
  score::Weights weights;
  std::chrono::milliseconds time_budget{10000};  // 0 表示不限时
  uint64_t max_iterations{0};                    // 0 表示不限次数
  int max_candidates{6};  // 每个决策点保留的候选数, 0 表示全部
  uint32_t seed{42};
  double initial_temperature{50.0};
  double cooling_rate{0.995};
  double target_gap{0.0};  // 间隙不大于该值即停止
};

/**
 * @brief 带时间预算的任意时刻可用求解器.
 * 先按 (优先级, 截止时间, 订单号) 顺序逐个工序贪心构造, 无候选时按时间顺序回溯;
 * 得到第一个完整解后在订单序列上做模拟退火邻域搜索, 始终保留最优解
 *
 */
class Solver : public WOSObject {
 public:
  enum class State {
    UNASSIGNED,           // 尚未开始
    PARTIALLY_ASSIGNED,   // 构造或改进中
    COMPLETE_FEASIBLE,    // 得到满足全部硬约束的完整解
    COMPLETE_INFEASIBLE,  // 预算内未得到完整解, 返回最好的部分解
  };
  struct Result {
    State state{State::UNASSIGNED};
    allocate::Assignment assignment;
    std::vector<int> sequence;  // 最优解对应的订单决策顺序
    double objective{0};  // 未得到完整解时为正无穷, 排在任何完整解之后
    double partial_objective{0};  // 部分解本身的目标值, 仅供参考
    double lower_bound{0};
    double optimality_gap{1.0};
    bool budget_exhausted{false};
    bool cancelled{false};
    uint64_t iterations{0};
    uint64_t backtracks{0};
    uint64_t improvements{0};
    std::chrono::milliseconds elapsed{0};
    bool complete() const { return state == State::COMPLETE_FEASIBLE; }
  };
  Solver(const std::string& name, problem::ProblemPtr p, SolverConfig cfg);
  Result solve();
  // 作用于进行中或下一次 solve, solve 返回时清除
  void cancel() { cancelled.store(true); }
  bool is_cancelled() const { return cancelled.load(); }
  State get_state() const { return state.load(); }
  static std::string get_state_name(State);
  double lower_bound() const;

 public:
  SolverConfig config;
  problem::ProblemPtr problem;
  event::PublisherPtr publisher;  // 可选, 发布每次更优解

 private:
  enum class Build { COMPLETE, EXHAUSTED, NO_CANDIDATE };
  struct Partial {
    size_t depth{0};
    allocate::Assignment assignment;
  };
  Build construct(const std::vector<int>& sequence, Partial* best);
  std::vector<allocate::Candidate> rank(std::vector<allocate::Candidate>,
                                        int makespan) const;
  double marginal(const allocate::Candidate&, int makespan) const;
  std::vector<int> neighbour(const std::vector<int>& seq,
                             const data::plan::Plan& plan);
  bool exhausted() const;
  double gap(double objective, double bound) const;
  void publish(double objective);

 private:
  allocate::EnginePtr engine;
  Extractor extractor;
  score::Scorer scorer;
  std::mt19937 rng;
  std::atomic<bool> cancelled{false};
  std::atomic<State> state{State::UNASSIGNED};
  std::chrono::steady_clock::time_point started;
  uint64_t iterations{0};
  uint64_t backtracks{0};
};
using SolverPtr = std::shared_ptr<Solver>;
}  // namespace planner
}  // namespace kernel
#endif
