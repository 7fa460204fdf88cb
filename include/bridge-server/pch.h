#pragma once
// Project-wide precompiled header for bridge-server
// Keep this header stable (only include headers that rarely change)

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Third-party headers used by most translation units.
// sol2 is left out: only the plugin sources need it.
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <bridge-server/export.h>

// End of pch.h
