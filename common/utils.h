#pragma once

#include <iostream>
#include <sstream>
#include <vector>
#include <algorithm>
#include <fstream>
#include <chrono>
#include <string>
#include <cstdint>
#include <cstdlib>

#include "./config.h"

#define ASSURE(condition, msg) \
  if (!(condition)) {              \
    std::cerr << msg << "\n  Line: " << __LINE__ << "\n"; \
    exit(1);                       \
  }

/// Like ASSURE, but reports the failure to the caller as an Exception
#define ASSURE_OR_THROW(condition, Exception, msg) \
  if (!(condition)) {                              \
    std::ostringstream assure_stream;              \
    assure_stream << msg;                          \
    throw Exception(assure_stream.str());          \
  }

#define UNREACHABLE ASSURE(false, "Unreachable")

#define PRINT(msg) std::cerr << msg << "\n";

#ifdef DEBUG
    #define DEV_ASSURE(condition, msg) ASSURE(condition, msg)
    #define DEV_ONLY(statement) statement
    #define DEV_PRINT(msg) PRINT(msg);
#else
    #define DEV_ASSURE(condition, msg)
    #define DEV_ONLY(statement)
    #define DEV_PRINT(msg)
#endif

inline auto start = std::chrono::high_resolution_clock::now();
inline void restartTime() { start = std::chrono::high_resolution_clock::now(); }

inline std::string duration() {
    auto elapsed = std::chrono::high_resolution_clock::now() - start;

    return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()) + "μs";
}
