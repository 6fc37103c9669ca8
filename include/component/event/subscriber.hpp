#ifndef SUBSCRIBER_HPP
#define SUBSCRIBER_HPP
#include <atomic>
#include <functional>
#include <set>
#include <utility>

#include "publisher.hpp"
namespace event {
/**
 * @brief 进度事件订阅方, types 为空时接收全部类型
 *
 */
class Subscriber : public WOSObject,
                   public ::std::enable_shared_from_this<Subscriber> {
 public:
  using WOSObject::WOSObject;
  Subscriber(const std::string& n,
             std::function<void(const std::shared_ptr<Event>&)> cb)
      : WOSObject(n) {
    event_handler = std::move(cb);
  }
  void subscriber(const std::shared_ptr<Publisher>&);
  void unsubscriber(const std::shared_ptr<Publisher>&);
  void on_event(const std::shared_ptr<Event>&);
  uint64_t get_received() const { return received.load(); }
  uint64_t get_failed() const { return failed.load(); }

 public:
  std::set<std::string> types;

 private:
  std::function<void(const std::shared_ptr<Event>&)> event_handler;
  std::atomic<uint64_t> received{0};
  std::atomic<uint64_t> failed{0};
};
}  // namespace event
#endif
