// src/common/log.hpp
// Leveled diagnostic output for the control path.
//
// Usage:
//   logging::info() << "Scheduled " << name << " at beat " << beat;
//
// Each call returns a temporary line; the text is written to std::cerr, with a
// level prefix, when the temporary is destroyed. Lines above the current print
// level are dropped without formatting cost beyond the stream insertions.
//
// Never call these from the audio callback: they format into a std::string.

#pragma once
#include <sstream>
#include <string>

namespace logging {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Lines at this level or lower are printed. Default: Info.
void set_level(Level level);
Level level();
bool enabled(Level level);

// Parse "error", "warn", "info" or "debug". Throws std::runtime_error.
Level parse_level(const std::string &name);

class Line {
public:
  explicit Line(Level level);
  ~Line();

  Line(const Line &) = delete;
  Line &operator=(const Line &) = delete;

  template <typename T> Line &operator<<(const T &value) {
    if (active_)
      out_ << value;
    return *this;
  }

private:
  Level level_;
  bool active_;
  std::ostringstream out_;
};

inline Line error() { return Line(Level::Error); }
inline Line warn() { return Line(Level::Warn); }
inline Line info() { return Line(Level::Info); }
inline Line debug() { return Line(Level::Debug); }

} // namespace logging
