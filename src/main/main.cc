#include <atomic>
#include <condition_variable>
#include <csignal>
#include <fstream>

#include <ghc/filesystem.hpp>

#include "../../include/main/wos.hpp"
INITIALIZE_EASYLOGGINGPP
// signal
std::condition_variable con;
std::mutex mut;
bool finished{false};
std::atomic<bool> interrupted{false};
void signalHandler(int) {
  interrupted.store(true);
  con.notify_one();
}

static std::optional<std::string> read_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void init_logging(const LogOptions &log,
                         std::deque<std::string> &logs_name) {
  el ::Configurations conf;
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf.setGlobally(el ::ConfigurationType ::Format, log.fmt);
  conf.setGlobally(el ::ConfigurationType ::Filename,
                   "" + get_log_name(log.path));
  conf.setGlobally(el ::ConfigurationType ::ToFile,
                   log.to_file ? "true" : "false");
  conf.setGlobally(el ::ConfigurationType ::Enabled,
                   log.enable ? "true" : "false");
  conf.setGlobally(el ::ConfigurationType ::ToStandardOutput,
                   log.to_stdout ? "true" : "false");
  conf.setGlobally(el ::ConfigurationType ::MillisecondsWidth, "4");
  conf.setGlobally(el ::ConfigurationType ::MaxLogFileSize, log.size);
  if (log.level == "debug") {
    conf.set(el::Level::Trace, el ::ConfigurationType ::Enabled, "false");
  } else if (log.level == "info") {
    conf.set(el::Level::Trace, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Debug, el ::ConfigurationType ::Enabled, "false");
  } else if (log.level == "warn") {
    conf.set(el::Level::Trace, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Debug, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Info, el ::ConfigurationType ::Enabled, "false");
  } else if (log.level == "error") {
    conf.set(el::Level::Trace, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Debug, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Info, el ::ConfigurationType ::Enabled, "false");
    conf.set(el::Level::Warning, el ::ConfigurationType ::Enabled, "false");
  } else {
    conf.set(el::Level::Global, el ::ConfigurationType ::Enabled, "false");
  }
  el ::Loggers ::reconfigureAllLoggers(conf);
  if (!log.to_file) {
    return;
  }
  try {
    ghc::filesystem::create_directories(log.path);
    auto dir_it = ghc::filesystem::directory_iterator(log.path);
    std::vector<ghc::filesystem::directory_entry> ns;
    for (auto &x : dir_it) {
      if (!x.is_directory() && x.path().filename() != "wos_.log") {
        ns.push_back(x);
      }
    }
    std::sort(ns.begin(), ns.end(),
              [](const ghc::filesystem::directory_entry &a,
                 const ghc::filesystem::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });
    for (auto &x : ns) {
      logs_name.push_back(x.path().filename().string());
    }
    while (logs_name.size() > log.max_num) {
      auto obj = logs_name.front();
      logs_name.pop_front();
      ghc::filesystem::remove(ghc::filesystem::path(log.path) / obj);
    }
  } catch (std::exception &ec) {
    LOG(WARNING) << ec.what();
  }
}

int main(int argc, char **argv) {
  el::Loggers::getLogger(wos_log);
  el::Loggers::getLogger(timer_log);
  el::Loggers::getLogger(builder_log);
  el::Loggers::getLogger(allocate_log);
  el::Loggers::getLogger(planner_log);
  el::Loggers::getLogger(score_log);
  el::Loggers::getLogger(event_log);
  if (argc < 3) {
    std::cerr << "usage: " << argv[0]
              << " <config.yaml> <batch.json> [baseline.json]\n";
    return 1;
  }
  auto opt = read_options(argv[1]);
  std::deque<std::string> logs_name;
  init_logging(opt.log, logs_name);
  auto log_path = opt.log.path;
  auto log_max_num = opt.log.max_num;
  el::Helpers::installPreRollOutCallback(
      [&](const char *filename, std::size_t size) {
        auto dest = get_log_path(log_path);
        logs_name.push_back(ghc::filesystem::path(dest).filename().string());
        ghc::filesystem::copy(get_log_name(log_path), dest);
        while (logs_name.size() > log_max_num) {
          auto obj = logs_name.front();
          logs_name.pop_front();
          ghc::filesystem::remove(ghc::filesystem::path(log_path) / obj);
        }
      });

  auto batch = read_file(argv[2]);
  if (!batch.has_value()) {
    CLOG(ERROR, wos_log) << "could not read batch file " << argv[2];
    return 1;
  }
  std::string body;
  {
    std::optional<std::string> baseline;
    if (argc >= 4) {
      baseline = read_file(argv[3]);
      if (!baseline.has_value()) {
        CLOG(ERROR, wos_log) << "could not read baseline file " << argv[3];
        return 1;
      }
    }
    body = "{\"batch\":" + batch.value();
    if (baseline.has_value()) {
      body += ",\"baseline\":" + baseline.value();
    }
    body += "}";
  }

  auto wos = std::make_shared<WOS>(opt);
  wos->publisher = std::make_shared<event::Publisher>("progress");
  auto progress = std::make_shared<event::Subscriber>(
      "progress_log", [](const event::EventPtr &e) {
        CLOG(INFO, event_log)
            << e->event_source << " " << e->event_type << " objective "
            << e->values["objective"] << " at " << e->values["elapsed_ms"]
            << "ms";
      });
  progress->subscriber(wos->publisher);

  // Ctrl + C 取消求解, 返回当前最优解
  signal(SIGINT, signalHandler);
  std::thread th_wait{[&] {
    std::unique_lock<std::mutex> lock(mut);
    con.wait(lock, [] { return finished || interrupted.load(); });
    if (!finished) {
      wos->cancel();
    }
  }};
  auto ret = wos->post_optimization(body);
  {
    std::lock_guard<std::mutex> lock(mut);
    finished = true;
  }
  con.notify_one();
  if (th_wait.joinable()) {
    th_wait.join();
  }
  std::cout << ret.second << std::endl;
  return ret.first == OK_200 ? 0 : ret.first / 100;
}
