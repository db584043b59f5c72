// LockerFetch - Platform Utilities
// System resource probes used by the resource monitor

#pragma once

#include <cstdint>
#include <string>

namespace lockerfetch::utils {

/**
 * @brief Operating system type
 */
enum class OS {
    Windows,
    macOS,
    Linux,
    Unknown
};

/**
 * @brief Cumulative CPU jiffies, as reported by /proc/stat
 */
struct CpuTimes {
    uint64_t idle{0};
    uint64_t total{0};
    bool valid{false};
};

/**
 * @brief Platform-specific utilities
 */
class PlatformUtils {
public:
    // OS detection
    static OS getOS();
    static std::string getOSName();

    // Memory
    static int64_t getTotalMemory();
    static int64_t getAvailableMemory();
    static int64_t getProcessResidentMemory();

    // CPU
    static int getCPUCores();
    static CpuTimes readCpuTimes();
    static double cpuUsageBetween(const CpuTimes& before, const CpuTimes& after);

    // Return freed heap pages to the OS where the allocator supports it
    static bool releaseFreeMemory();
};

} // namespace lockerfetch::utils
