/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

namespace qamem {
namespace memory {

/**
 * Rotation angle that splits off a 1/j share of the remaining amplitude:
 * -2 * acos(sqrt((j - 1) / j)). find_angle(1) == -pi moves all of it.
 * Throws InvalidScheduleIndex for j < 1.
 */
double find_angle(int j);

// j for the pattern at 1-based load_index out of pattern_count
int schedule_index(int pattern_count, int load_index);

} // namespace memory
} // namespace qamem
