#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::string g_log_path;
StatusCallback g_echo;
std::mutex g_log_mutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

void init_logging(const RuntimeOptions& options, StatusCallback echo) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = options.log_path;
    g_echo = options.verbose ? std::move(echo) : nullptr;
}

const std::string& twin_log_path() {
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    }
    return g_log_path;
}

void twin_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_echo) g_echo(msg);

    std::ofstream out(twin_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << timestamp() << "] " << msg << "\n";
}

void twin_log_process(const std::string& label, const std::string& cmd,
                      const ProcessResult& r) {
    twin_log(fmt::format("{} CMD: {}", label, cmd));
    twin_log(fmt::format("{} exit={} timed_out={} stdout({})={}", label, r.exit_code,
                         r.timed_out, r.stdout_data.size(),
                         r.stdout_data.substr(0, LOG_OUTPUT_TRUNCATE)));
    if (!r.stderr_data.empty())
        twin_log(fmt::format("{} stderr={}", label,
                             r.stderr_data.substr(0, LOG_OUTPUT_TRUNCATE)));
}
