#ifndef EQUIPMENT_HPP
#define EQUIPMENT_HPP
#include "../../wosobject.hpp"
#include "./stage.hpp"
namespace data {
namespace model {
/**
 * @brief 单台设备, 只服务一种工序, 同一时刻只能被一个工序实例占用
 *
 */
class Equipment : public WOSObject {
 public:
  using WOSObject::WOSObject;
  StageType stage{StageType::PACK};
  std::string kind;  // packing_station, pick_cart ...
  double hourly_cost{0};
  double efficiency{1.0};
};
using EquipmentPtr = std::shared_ptr<const Equipment>;
}  // namespace model
}  // namespace data
#endif
