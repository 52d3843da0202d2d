#include "docdiff/log.hpp"

#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>

namespace docdiff::log {

namespace {

constexpr const char *kLoggerName = "docdiff";

spdlog::level::level_enum to_spdlog(Level lvl) {
  switch (lvl) {
  case Level::Debug:
    return spdlog::level::debug;
  case Level::Info:
    return spdlog::level::info;
  case Level::Warn:
    return spdlog::level::warn;
  case Level::Error:
    return spdlog::level::err;
  case Level::Off:
    return spdlog::level::off;
  }
  return spdlog::level::off;
}

Level from_spdlog(spdlog::level::level_enum lvl) {
  switch (lvl) {
  case spdlog::level::trace:
  case spdlog::level::debug:
    return Level::Debug;
  case spdlog::level::info:
    return Level::Info;
  case spdlog::level::warn:
    return Level::Warn;
  case spdlog::level::err:
  case spdlog::level::critical:
    return Level::Error;
  default:
    return Level::Off;
  }
}

// Forwards formatted payloads to a user callback. The base sink's mutex
// serializes calls coming from worker threads.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  explicit CallbackSink(Sink sink) : sink_(std::move(sink)) {}

protected:
  void sink_it_(const spdlog::details::log_msg &msg) override {
    sink_(from_spdlog(msg.level), std::string_view(msg.payload.data(), msg.payload.size()));
  }
  void flush_() override {}

private:
  Sink sink_;
};

std::shared_ptr<spdlog::logger> make_logger(Sink sink) {
  spdlog::sink_ptr out;
  if (sink) {
    out = std::make_shared<CallbackSink>(std::move(sink));
  } else {
    out = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    out->set_pattern("[%l] %v");
  }
  return std::make_shared<spdlog::logger>(kLoggerName, std::move(out));
}

std::atomic<Level> g_level{Level::Warn};

struct LoggerState {
  std::mutex mu; // guards the pointer swap only, never held while logging
  std::shared_ptr<spdlog::logger> logger;
};

LoggerState &state() {
  static LoggerState s;
  return s;
}

std::shared_ptr<spdlog::logger> current() {
  auto &s = state();
  std::lock_guard<std::mutex> lock(s.mu);
  if (!s.logger) {
    s.logger = make_logger({});
    s.logger->set_level(to_spdlog(g_level.load()));
  }
  return s.logger;
}

} // namespace

void set_level(Level lvl) {
  g_level.store(lvl);
  current()->set_level(to_spdlog(lvl));
}

Level level() { return g_level.load(); }

void set_sink(Sink sink) {
  auto logger = make_logger(std::move(sink));
  logger->set_level(to_spdlog(g_level.load()));
  auto &s = state();
  std::lock_guard<std::mutex> lock(s.mu);
  s.logger = std::move(logger);
}

void write(Level lvl, std::string_view message) {
  if (lvl == Level::Off)
    return;
  current()->log(to_spdlog(lvl), spdlog::string_view_t(message.data(), message.size()));
}

std::string_view level_name(Level lvl) {
  switch (lvl) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  case Level::Off:
    return "off";
  }
  return "?";
}

bool parse_level(std::string_view name, Level &out) {
  for (Level l : {Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Off}) {
    if (level_name(l) == name) {
      out = l;
      return true;
    }
  }
  return false;
}

} // namespace docdiff::log
