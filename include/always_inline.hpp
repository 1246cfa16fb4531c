#pragma once

#define ALWAYS_INLINE __attribute__((always_inline))
