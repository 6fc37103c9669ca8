#ifndef TOOLS_HPP
#define TOOLS_HPP
#include <time.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <regex>
#include <sstream>
#include <utility>

#include <easylogging++.h>
#include <uuid.h>
constexpr auto timer_log{"timer"};
class cpu_timer {
 public:
  explicit cpu_timer(std::string n = "")
      : name(std::move(n)), start(std::chrono::steady_clock::now()) {}
  ~cpu_timer() {
    auto end = std::chrono::steady_clock::now();
    auto dur =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    uint32_t s = dur.count() / 1000000;
    uint32_t ms = (dur.count() / 1000) % 1000;
    uint32_t us = dur.count() % 1000;
    CLOG(INFO, timer_log) << name << " use time: " << s << "(s) " << ms
                          << "(ms) " << us << "(us)\n";
  }

 private:
  std::string name;
  std::chrono::time_point<std::chrono::steady_clock> start;
};

inline std::string get_time_fmt_utc(std::chrono::system_clock::time_point t) {
  const auto tm = std::chrono::system_clock::to_time_t(t);
  std::stringstream time;
  const auto p = std::chrono::duration_cast<std::chrono::milliseconds>(
                     t.time_since_epoch())
                     .count();
  std::tm utc{};
  gmtime_r(&tm, &utc);
  time << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S.") << std::setw(3)
       << std::setfill('0') << p % 1000 << "Z";
  return time.str();
}

/**
 * @brief 解析 UTC 时间 2026-10-19T08:00:00.000Z, 毫秒部分可省略
 *
 * @param msg
 * @return std::optional<std::chrono::system_clock::time_point>
 */
inline std::optional<std::chrono::system_clock::time_point> get_time_from_str(
    const std::string &msg) {
  const std::regex search_reg{
      R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(\.(\d{1,6}))?Z$)"};
  try {
    std::smatch cmatch;
    if (!std::regex_match(msg, cmatch, search_reg)) {
      return std::nullopt;
    }
    std::tm t = {};
    t.tm_year = std::stoi(cmatch[1]) - 1900;
    t.tm_mon = std::stoi(cmatch[2]) - 1;
    t.tm_mday = std::stoi(cmatch[3]);
    t.tm_hour = std::stoi(cmatch[4]);
    t.tm_min = std::stoi(cmatch[5]);
    t.tm_sec = std::stoi(cmatch[6]);
    auto time_point = std::chrono::system_clock::from_time_t(timegm(&t));
    if (cmatch[8].matched) {
      std::string tail = cmatch[8];
      tail.resize(6, '0');
      time_point += std::chrono::microseconds(std::stoi(tail));
    }
    return time_point;
  } catch (std::exception &ec) {
    CLOG(ERROR, timer_log) << ec.what();
    return std::nullopt;
  }
}

// 两个时间点之间的分钟数, 向下取整
inline int minutes_between(std::chrono::system_clock::time_point from,
                           std::chrono::system_clock::time_point to) {
  auto sec =
      std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
  return static_cast<int>(std::floor(static_cast<double>(sec) / 60.0));
}

inline static std::mt19937 make_seeded_generator() {
  std::random_device rd;
  auto seed_data = std::array<int, std::mt19937::state_size>{};
  std::generate(std::begin(seed_data), std::end(seed_data), std::ref(rd));
  std::seed_seq seq(std::begin(seed_data), std::end(seed_data));
  return std::mt19937(seq);
}
inline static uuids::uuid get_uuid() {
  static std::mutex mut;
  std::lock_guard<std::mutex> lock(mut);
  static std::mt19937 generator = make_seeded_generator();
  static uuids::uuid_random_generator gen{generator};
  uuids::uuid const id = gen();
  return id;
}
inline static std::chrono::system_clock::time_point get_now_utc_time() {
  auto now = std::chrono::system_clock::now();
  return now;
}
#endif
