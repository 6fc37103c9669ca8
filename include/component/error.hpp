#ifndef ERROR_HPP
#define ERROR_HPP
#include <stdexcept>
#include <string>
#include <vector>

#include "./data/model/stage.hpp"
namespace error {
/**
 * @brief 求解前置校验失败的基类, 配置问题, 不重试
 *
 */
class SolveError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// 订单或资源记录缺失/非法
class InvalidInput : public SolveError {
 public:
  explicit InvalidInput(const std::string& msg,
                        std::vector<std::string> details = {})
      : SolveError(msg), details_(std::move(details)) {
    if (details_.empty()) {
      details_.push_back(msg);
    }
  }
  const std::vector<std::string>& details() const { return details_; }

 private:
  std::vector<std::string> details_;
};

// 某工序不存在可用的人员或设备, 硬约束无解
class Infeasible : public SolveError {
 public:
  Infeasible(data::model::StageType stage, std::string constraint,
             const std::string& msg)
      : SolveError(msg), stage_(stage), constraint_(std::move(constraint)) {}
  data::model::StageType stage() const { return stage_; }
  const std::string& constraint() const { return constraint_; }

 private:
  data::model::StageType stage_;
  std::string constraint_;
};
}  // namespace error
#endif
