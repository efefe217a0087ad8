//
// Created by the causal_adjust developers on 10/19/26.
//
#pragma once

#include "spdlog/spdlog.h"
#include <chrono>
#include <memory>
using namespace std::chrono;

inline double measure_time(const high_resolution_clock::time_point start_time) {
    return duration_cast<duration<double>>(high_resolution_clock::now() - start_time)
            .count();
}

// The CLI registers "stdout_logger"; library users and tests may not.
inline std::shared_ptr<spdlog::logger> get_logger() {
    auto logger = spdlog::get("stdout_logger");
    if (!logger) { logger = spdlog::default_logger(); }
    return logger;
}
