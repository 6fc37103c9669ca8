#ifndef WOSOBJECT_HPP
#define WOSOBJECT_HPP
#include <deque>
#include <iostream>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "./util/tools.hpp"
constexpr auto wos_log{"wos"};
constexpr auto builder_log{"builder"};
constexpr auto allocate_log{"allocate"};
constexpr auto planner_log{"planner"};
constexpr auto score_log{"score"};
constexpr auto event_log{"event"};

class WOSObject {
 public:
  WOSObject() = delete;
  virtual ~WOSObject() = default;
  explicit WOSObject(const std::string& n) : name(n) {
    std::hash<std::string> hash_fn;
    name_hash = hash_fn(n);
  }

 public:
  std::string name;
  size_t name_hash;
  std::map<std::string, std::string> properties;
};
using WOSObjectPtr = std::shared_ptr<WOSObject>;
#endif
