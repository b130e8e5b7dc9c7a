#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <format>
#include <limits>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Core library headers - these provide assert, logger, and utilities
#include <facemetrics/core/assert.hpp>
#include <facemetrics/core/core.hpp>
#include <facemetrics/core/logger.hpp>
