#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include "../kernel/planner/solver.hpp"
namespace Yaml {
class Node;
}
struct LogOptions {
  bool enable{true};
  std::string level{"info"};
  bool to_file{false};
  bool to_stdout{true};
  std::string path{"logs"};
  std::string fmt{"[%level] %datetime %fbase:%line] %msg"};
  std::string size{"10485760"};
  uint32_t max_num{5};
};

/**
 * @brief 运行配置, 未给出的键保持默认值
 *
 */
struct Options {
  LogOptions log;
  kernel::planner::SolverConfig solver;
  kernel::problem::DurationRules durations;
  int horizon_minutes{1440};
  size_t max_batch_size{500};
  size_t order_limit{0};  // 0 表示不限制
  double default_hourly_rate{25.0};
};

// 从 yaml 文件读取, 文件不合法时记录错误并返回默认配置
Options read_options(const std::string& path);
// 从 yaml 文本读取
Options parse_options(const std::string& text);
void load_options(Yaml::Node& root, Options& opt);

inline std::string get_log_path(const std::string& path) {
  auto data = get_time_fmt_utc(get_now_utc_time());
#ifdef _WIN32
  return (std::string(path) + "\\" + data + ".log");
#else
  return (std::string(path) + "/" + data + ".log");
#endif
}
inline std::string get_log_name(const std::string& path) {
#ifdef _WIN32
  return (std::string(path) + "\\wos_" + ".log");
#else
  return (std::string(path) + "/wos_" + ".log");
#endif
}
#endif
