#ifndef EVENTBASE_HPP
#define EVENTBASE_HPP
#include <chrono>

#include "../wosobject.hpp"
namespace event {
class Event : public WOSObject {
 public:
  using WOSObject::WOSObject;
  ~Event() override = default;
  std::chrono::steady_clock::time_point event_time;
  std::string event_type;
  std::string event_source;
  std::map<std::string, std::string> msg;
  std::map<std::string, double> values;  // 数值类负载, 如目标值
};
using EventPtr = std::shared_ptr<Event>;
}  // namespace event
#endif
