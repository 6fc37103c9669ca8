#ifndef STAGE_HPP
#define STAGE_HPP
#include <array>
#include <optional>
#include <string>
namespace data {
namespace model {
/**
 * @brief 订单的六个固定工序, 顺序即硬性先后约束
 *
 */
enum class StageType {
  PICK = 0,
  CONSOLIDATE = 1,
  PACK = 2,
  LABEL = 3,
  STAGE = 4,
  SHIP = 5
};
constexpr int kStageCount{6};
constexpr std::array<StageType, kStageCount> kStages{
    StageType::PICK,  StageType::CONSOLIDATE, StageType::PACK,
    StageType::LABEL, StageType::STAGE,       StageType::SHIP};

inline int stage_index(StageType t) { return static_cast<int>(t); }

inline std::string get_stage_name(StageType t) {
  if (t == StageType::PICK) {
    return "PICK";
  } else if (t == StageType::CONSOLIDATE) {
    return "CONSOLIDATE";
  } else if (t == StageType::PACK) {
    return "PACK";
  } else if (t == StageType::LABEL) {
    return "LABEL";
  } else if (t == StageType::STAGE) {
    return "STAGE";
  } else {
    return "SHIP";
  }
}

inline std::optional<StageType> new_stage(const std::string& name) {
  for (auto& t : kStages) {
    if (get_stage_name(t) == name) {
      return t;
    }
  }
  return std::nullopt;
}

// 需要设备的工序: 拣货车, 打包台, 月台门
inline bool requires_equipment(StageType t) {
  return t == StageType::PICK || t == StageType::PACK ||
         t == StageType::SHIP;
}

inline std::string equipment_kind(StageType t) {
  if (t == StageType::PICK) {
    return "pick_cart";
  } else if (t == StageType::PACK) {
    return "packing_station";
  } else if (t == StageType::SHIP) {
    return "dock_door";
  } else if (t == StageType::LABEL) {
    return "label_printer";
  }
  return "";
}
}  // namespace model
}  // namespace data
#endif
