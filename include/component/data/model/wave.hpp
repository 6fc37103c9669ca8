#ifndef WAVE_HPP
#define WAVE_HPP
#include "./equipment.hpp"
#include "./order.hpp"
#include "./worker.hpp"
namespace data {
namespace model {
/**
 * @brief 一个波次: 同时释放的订单以及资源池快照
 *
 */
struct Wave {
  std::chrono::system_clock::time_point start;
  std::vector<OrderPtr> orders;
  std::vector<WorkerPtr> workers;
  std::vector<EquipmentPtr> equipment;
};
}  // namespace model
}  // namespace data
#endif
