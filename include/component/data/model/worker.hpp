#ifndef WORKER_HPP
#define WORKER_HPP
#include "../../wosobject.hpp"
#include "./stage.hpp"
namespace data {
namespace model {
class Worker : public WOSObject {
 public:
  using WOSObject::WOSObject;
  bool can_do(StageType t) const {
    return capabilities.find(t) != capabilities.end();
  }

 public:
  std::set<StageType> capabilities;
  std::optional<double> hourly_rate;  // 缺省时使用配置的默认工资
  double efficiency{1.0};
};
using WorkerPtr = std::shared_ptr<const Worker>;
}  // namespace model
}  // namespace data
#endif
