#ifndef PUBLISHER_HPP
#define PUBLISHER_HPP
#include "event.hpp"
namespace event {
class Subscriber;
class Publisher : public WOSObject,
                  public std::enable_shared_from_this<Publisher> {
 public:
  using WOSObject::WOSObject;
  void add_suber(const std::shared_ptr<Subscriber>&);
  void remove_suber(const std::shared_ptr<Subscriber>&);
  void publish(const std::shared_ptr<Event>& e);
  size_t suber_count();

 protected:
  std::map<std::string, std::weak_ptr<Subscriber>> subers;
  std::mutex mut;
};
using PublisherPtr = std::shared_ptr<Publisher>;
}  // namespace event
#endif
