#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace fractal::logsys {

struct LogOptions {
    std::filesystem::path logDir;                 // empty = console only
    spdlog::level::level_enum level = spdlog::level::info;
};

void init(const LogOptions& opts = {});       // console + rotating "fractal.log"
std::shared_ptr<spdlog::logger> get();        // "fractal"; lazily created if init() was skipped

}
