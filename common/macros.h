#pragma once

#include <cstddef>

// Branch prediction hint
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

// Keeps hot atomics of the logger on separate lines
#define CACHE_LINE_SIZE 64
