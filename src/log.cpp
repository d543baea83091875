// -----------------------------------------------------------------------------
// log.cpp - Implementation of the akka::log line writer
//
// API: see include/akka/log.hpp
// -----------------------------------------------------------------------------
#include "akka/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace akka::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::atomic<Sink>  g_sink{nullptr};
std::mutex         g_write_mu;        // detached HTTP / TTS threads may log too

void stderr_sink(Level, const std::string& line) {
  std::cerr << line << '\n';
}

} // namespace

void set_level(Level level) { g_level.store(level); }
Level level() { return g_level.load(); }

void set_sink(Sink sink) { g_sink.store(sink); }

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
  }
  return "info";
}

void write(Level lvl, const char* comp, const char* reason, const std::string& detail) {
  if (static_cast<unsigned char>(lvl) < static_cast<unsigned char>(g_level.load())) return;

  std::string line;
  line.reserve(48 + detail.size());
  line += "[akka] level=";
  line += level_name(lvl);
  line += " comp=";
  line += comp ? comp : "-";
  line += " reason=";
  line += reason ? reason : "-";
  if (!detail.empty()) {
    line += ' ';
    line += detail;
  }

  Sink sink = g_sink.load();
  std::lock_guard<std::mutex> lock(g_write_mu);
  if (sink) sink(lvl, line);
  else      stderr_sink(lvl, line);
}

} // namespace akka::log
