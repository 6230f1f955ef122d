#pragma once

// Precompiled headers (PCH) for faster local builds.
//
// Only stable standard library headers go here; no project headers.
//
// Enabled via CMake option: EDFIO_ENABLE_PCH=ON

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
