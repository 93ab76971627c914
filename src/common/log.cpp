// src/common/log.cpp

#include "common/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace logging {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write;

const char *prefix(Level level) {
  switch (level) {
  case Level::Error:
    return "error: ";
  case Level::Warn:
    return "warn:  ";
  case Level::Info:
    return "info:  ";
  case Level::Debug:
    return "debug: ";
  }
  return "";
}

} // namespace

void set_level(Level level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Level level() {
  return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool enabled(Level lvl) {
  return static_cast<int>(lvl) <= g_level.load(std::memory_order_relaxed);
}

Level parse_level(const std::string &name) {
  if (name == "error")
    return Level::Error;
  if (name == "warn")
    return Level::Warn;
  if (name == "info")
    return Level::Info;
  if (name == "debug")
    return Level::Debug;
  throw std::runtime_error("Unknown log level: " + name);
}

Line::Line(Level lvl) : level_(lvl), active_(enabled(lvl)) {}

Line::~Line() {
  if (!active_)
    return;
  // Lines from different threads must not interleave.
  std::lock_guard<std::mutex> lock(g_write);
  std::cerr << prefix(level_) << out_.str() << "\n";
}

} // namespace logging
