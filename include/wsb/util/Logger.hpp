#pragma once

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace wsb {
namespace util {

enum class LogLevel : int {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4
};

struct Field {
  std::string k;
  std::string v;
};

/// Case-insensitive; unknown names map to Info.
LogLevel parseLevel(const std::string& s);
const char* levelName(LogLevel l);

class Logger {
public:
  Logger();
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl);
  void setFormatJson(bool json);

  // empty -> stdout. Returns false (and keeps stdout) if the file can't be opened.
  bool setFile(const std::string& path);

  // Redirect output to an already open stream (not owned). Used by tests.
  void setStream(std::FILE* f);

  LogLevel level() const;
  bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) >= static_cast<int>(level()); }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  // Thread-local context fields appended to every line logged by this
  // thread while the object is alive.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::size_t mark_;
  };

  // Formats a single line without writing it. Exposed for tests.
  std::string format(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) const;

private:
  void closeFileLocked();

private:
  mutable std::mutex mx_;
  std::FILE* file_ = nullptr;  // nullptr -> stdout
  bool ownsFile_ = false;
  LogLevel lvl_ = LogLevel::Info;
  bool json_ = false;
};

Logger& logger();

} // namespace util
} // namespace wsb
