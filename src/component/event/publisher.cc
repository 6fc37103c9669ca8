#include "../../../include/component/event/publisher.hpp"

#include "../../../include/component/event/subscriber.hpp"
namespace event {

void Publisher::add_suber(const std::shared_ptr<Subscriber>& s) {
  std::lock_guard<std::mutex> lock(mut);
  subers[s->name] = s;
}

void Publisher::remove_suber(const std::shared_ptr<Subscriber>& s) {
  std::lock_guard<std::mutex> lock(mut);
  auto p = subers.find(s->name);
  if (p != subers.end()) {
    subers.erase(p);
  }
}

size_t Publisher::suber_count() {
  std::lock_guard<std::mutex> lock(mut);
  return subers.size();
}

void Publisher::publish(const std::shared_ptr<Event>& e) {
  std::vector<std::shared_ptr<Subscriber>> alive;
  {
    std::lock_guard<std::mutex> lock(mut);
    for (auto it = subers.begin(); it != subers.end();) {
      auto p = it->second.lock();
      if (p) {
        alive.push_back(p);
        it++;
      } else {
        it = subers.erase(it);
      }
    }
  }
  // 回调在锁外执行, 允许回调中再订阅/取消订阅
  for (auto& p : alive) {
    p->on_event(e);
  }
}
}  // namespace event
