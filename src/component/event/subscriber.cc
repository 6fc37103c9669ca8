#include "../../../include/component/event/subscriber.hpp"
namespace event {

void Subscriber::subscriber(const std::shared_ptr<Publisher>& pub) {
  pub->add_suber(shared_from_this());
}

void Subscriber::unsubscriber(const std::shared_ptr<Publisher>& pub) {
  pub->remove_suber(shared_from_this());
}

void Subscriber::on_event(const std::shared_ptr<Event>& e) {
  if (!event_handler) {
    return;
  }
  if (!types.empty() && types.count(e->event_type) == 0) {
    return;
  }
  received++;
  // 进度消费方出错不能中断求解
  try {
    event_handler(e);
  } catch (std::exception& ec) {
    failed++;
    CLOG(WARNING, event_log) << name << " failed on " << e->event_type
                             << " from " << e->event_source << ": "
                             << ec.what();
  }
}
}  // namespace event
