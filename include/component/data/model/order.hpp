#ifndef ORDER_MODEL_HPP
#define ORDER_MODEL_HPP
#include <chrono>

#include "../../wosobject.hpp"
namespace data {
namespace model {
/**
 * @brief 待履约的客户订单, 提交求解后只读
 *
 */
class Order : public WOSObject {
 public:
  using WOSObject::WOSObject;
  bool premium() const { return customer_type == "premium"; }

 public:
  std::optional<int> priority;  // 1 最高, 5 最低
  std::optional<std::chrono::system_clock::time_point> deadline;  // 发运截止
  int item_count{0};
  double total_weight{0};
  double pick_minutes{0};  // 0 表示未知
  double pack_minutes{0};
  double walking_minutes{0};  // 拣货行走时间, 计入 PICK
  std::string customer_type{"standard"};  // standard, premium
};
using OrderPtr = std::shared_ptr<const Order>;
}  // namespace model
}  // namespace data
#endif
