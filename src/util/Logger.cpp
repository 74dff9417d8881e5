#include "wsb/util/Logger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wsb::util {

static thread_local std::vector<Field> t_ctx;

const char* levelName(LogLevel l) {
  switch (l) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "info")  return LogLevel::Info;
  if (x == "warn" || x == "warning") return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger L;
  return L;
}

Logger::Logger() {}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  closeFileLocked();
}

void Logger::setLevel(LogLevel lvl) {
  std::lock_guard<std::mutex> lk(mx_);
  lvl_ = lvl;
}

void Logger::setFormatJson(bool json) {
  std::lock_guard<std::mutex> lk(mx_);
  json_ = json;
}

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  closeFileLocked();
  if (path.empty()) return true;
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) return false;
  file_ = f;
  ownsFile_ = true;
  return true;
}

void Logger::setStream(std::FILE* f) {
  std::lock_guard<std::mutex> lk(mx_);
  closeFileLocked();
  file_ = f;
}

void Logger::closeFileLocked() {
  if (file_ && ownsFile_) std::fclose(file_);
  file_ = nullptr;
  ownsFile_ = false;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lk(mx_);
  return lvl_;
}

static std::string nowIso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

static void jsonEscape(std::ostringstream& oss, const std::string& s) {
  for (unsigned char c : s) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
              << std::dec << std::setfill(' ');
        } else {
          oss << static_cast<char>(c);
        }
    }
  }
}

std::string Logger::format(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) const {
  bool json;
  {
    std::lock_guard<std::mutex> lk(mx_);
    json = json_;
  }

  std::ostringstream oss;
  if (json) {
    oss << "{\"ts\":\"" << nowIso() << "\",\"lvl\":\"" << levelName(lvl) << "\",\"msg\":\"";
    jsonEscape(oss, msg);
    oss << "\"";
    auto emit = [&oss](const Field& kv) {
      oss << ",\"";
      jsonEscape(oss, kv.k);
      oss << "\":\"";
      jsonEscape(oss, kv.v);
      oss << "\"";
    };
    for (auto& kv : t_ctx) emit(kv);
    for (auto& kv : fields) emit(kv);
    oss << "}\n";
  } else {
    oss << '[' << nowIso() << "] " << std::left << std::setw(5) << levelName(lvl) << ' ' << msg;
    for (auto& kv : t_ctx) oss << ' ' << kv.k << '=' << kv.v;
    for (auto& kv : fields) oss << ' ' << kv.k << '=' << kv.v;
    oss << '\n';
  }
  return oss.str();
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  const std::string line = format(lvl, msg, fields);

  std::lock_guard<std::mutex> lk(mx_);
  std::FILE* f = file_ ? file_ : stdout;
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add)
  : mark_(t_ctx.size())
{
  t_ctx.insert(t_ctx.end(), add.begin(), add.end());
}

Logger::Scoped::~Scoped() {
  t_ctx.resize(mark_);
}

} // namespace wsb::util
