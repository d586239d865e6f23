/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/memory/angle_schedule.hpp"
#include "qamem/quantum/errors.hpp"
#include <fmt/format.h>
#include <cmath>

namespace qamem {
namespace memory {

double find_angle(int j) {
    if (j < 1) {
        throw quantum::InvalidScheduleIndex(fmt::format(
            "Rotation schedule index must be >= 1, got {}", j));
    }
    const double jd = static_cast<double>(j);
    return -2.0 * std::acos(std::sqrt((jd - 1.0) / jd));
}

int schedule_index(int pattern_count, int load_index) {
    return pattern_count + 1 - load_index;
}

} // namespace memory
} // namespace qamem
