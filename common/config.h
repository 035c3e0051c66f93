#pragma once

// Enables additional debug printing and consistency checks (reducing performance)
// #define DEBUG true
