#include <runbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/details/console_globals.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// the sandbox forks from worker threads; a console mutex held by another thread
// at fork time would stay locked forever in the child
bool HasConsoleSink() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (dynamic_cast<ansicolor_sink*>(i.get())) return true;
  }
  return false;
}

void Prepare() {
  if (HasConsoleSink()) spdlog::details::console_mutex::mutex().lock();
}

void Release() {
  if (HasConsoleSink()) spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger(int verbosity) {
  spdlog::set_pattern("[%t] %+");
  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
  static bool registered = false;
  if (registered) return;
  registered = true;
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
