#include "logging/Log.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace fractal::logsys {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_mutex;

static std::shared_ptr<spdlog::logger> make_logger(const LogOptions& opts) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!opts.logDir.empty()) {
        std::error_code ec;
        fs::create_directories(opts.logDir, ec);
        if (!ec) {
            auto file = (opts.logDir / "fractal.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        }
    }

    auto logger = std::make_shared<spdlog::logger>("fractal", sinks.begin(), sinks.end());
    logger->set_level(opts.level);
    return logger;
}

void init(const LogOptions& opts) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = make_logger(opts);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::debug("Logging started");
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger(LogOptions{});
        spdlog::set_default_logger(g_logger);
    }
    return g_logger;
}

}
