#pragma once

#include <spdlog/spdlog.h>

#include <cstdlib>

#define ASSERT(condition)                                                               \
	do {                                                                                \
		if (!(condition)) {                                                             \
			spdlog::error("Assertion failed {} {}:{}", #condition, __FILE__, __LINE__); \
			std::abort();                                                               \
		}                                                                               \
	} while (0)
