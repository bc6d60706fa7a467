#include "lh/log.hpp"

#include <algorithm>

namespace {
std::once_flag log_initialized;

/// Strip the directories from a source file name, the full path adds noise to every line.
char const* basename(char const* filename) {
  char const* base = filename;
  for (char const* p = filename; *p != '\0'; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}
} // anonymous namespace

namespace lh {

std::unique_ptr<log> log::singleton_;

log& log::instance() {
  std::call_once(log_initialized, []() { singleton_.reset(new log); });
  return *singleton_;
}

void log::add_sink(std::shared_ptr<log_sink> sink) {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.push_back(std::move(sink));
}

bool log::remove_sink(std::shared_ptr<log_sink> const& sink) {
  std::lock_guard<std::mutex> guard(mu_);
  auto i = std::find(sinks_.begin(), sinks_.end(), sink);
  if (i == sinks_.end()) {
    return false;
  }
  sinks_.erase(i);
  return true;
}

void log::clear_sinks() {
  std::lock_guard<std::mutex> guard(mu_);
  sinks_.clear();
}

void log::write(severity sev, std::string&& msg) {
  std::vector<std::shared_ptr<log_sink>> sinks;
  {
    std::lock_guard<std::mutex> guard(mu_);
    if (sinks_.empty() or sev < min_severity_) {
      return;
    }
    sinks = sinks_;
  }
  // Special case, very common and avoid copying the message ...
  if (sinks.size() == 1) {
    sinks[0]->log(sev, std::move(msg));
    return;
  }
  for (auto const& s : sinks) {
    std::string copy(msg);
    s->log(sev, std::move(copy));
  }
}

logger<false>::logger(severity s, char const* func, char const* file, int l, log& sink)
    : os()
    , sev(s)
    , closed(sev < sink.min_severity()) {
  if (closed) {
    return;
  }
  function = func;
  filename = basename(file);
  lineno = l;
  os << "[" << sev << "] ";
}

void logger<false>::write_to(log& sink) {
  closed = true;
  os << " in " << function << "(" << filename << ":" << lineno << ")";
  sink.write(sev, os.str());
}

} // namespace lh
