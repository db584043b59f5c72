/**
 * PlatformUtils.cpp
 * 
 * System resource probes. Linux reads /proc; other platforms fall back
 * to conservative values.
 */

#include "PlatformUtils.hpp"
#include "StringUtils.hpp"

#include <fstream>
#include <sstream>
#include <thread>

#if defined(__linux__)
#include <unistd.h>
#include <sys/sysinfo.h>
#include <malloc.h>
#endif

namespace lockerfetch::utils {

OS PlatformUtils::getOS() {
#ifdef _WIN32
    return OS::Windows;
#elif defined(__APPLE__)
    return OS::macOS;
#elif defined(__linux__)
    return OS::Linux;
#else
    return OS::Unknown;
#endif
}

std::string PlatformUtils::getOSName() {
    switch (getOS()) {
        case OS::Windows: return "Windows";
        case OS::macOS: return "macOS";
        case OS::Linux: return "Linux";
        default: return "Unknown";
    }
}

namespace {

#if defined(__linux__)
// Value of a "Key:   1234 kB" line in /proc/meminfo, in bytes
int64_t readMeminfoField(const std::string& key) {
    std::ifstream file("/proc/meminfo");
    std::string line;
    while (std::getline(file, line)) {
        if (StringUtils::startsWith(line, key + ":")) {
            std::istringstream iss(line.substr(key.size() + 1));
            int64_t kb = 0;
            iss >> kb;
            return kb * 1024;
        }
    }
    return -1;
}
#endif

} // namespace

int64_t PlatformUtils::getTotalMemory() {
#if defined(__linux__)
    int64_t total = readMeminfoField("MemTotal");
    if (total > 0) return total;
    struct sysinfo si;
    if (sysinfo(&si) == 0) return static_cast<int64_t>(si.totalram) * si.mem_unit;
#endif
    return 0;
}

int64_t PlatformUtils::getAvailableMemory() {
#if defined(__linux__)
    int64_t available = readMeminfoField("MemAvailable");
    if (available >= 0) return available;
    struct sysinfo si;
    if (sysinfo(&si) == 0) return static_cast<int64_t>(si.freeram) * si.mem_unit;
#endif
    return 0;
}

int64_t PlatformUtils::getProcessResidentMemory() {
#if defined(__linux__)
    std::ifstream file("/proc/self/statm");
    int64_t sizePages = 0;
    int64_t residentPages = 0;
    if (file >> sizePages >> residentPages) {
        return residentPages * static_cast<int64_t>(sysconf(_SC_PAGESIZE));
    }
#endif
    return 0;
}

int PlatformUtils::getCPUCores() {
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    return cores > 0 ? cores : 1;
}

CpuTimes PlatformUtils::readCpuTimes() {
    CpuTimes times;
#if defined(__linux__)
    std::ifstream file("/proc/stat");
    std::string label;
    if (!(file >> label) || label != "cpu") return times;

    // user nice system idle iowait irq softirq steal
    uint64_t values[8] = {0};
    for (auto& v : values) {
        if (!(file >> v)) break;
    }
    times.idle = values[3] + values[4];
    for (auto v : values) times.total += v;
    times.valid = times.total > 0;
#endif
    return times;
}

double PlatformUtils::cpuUsageBetween(const CpuTimes& before, const CpuTimes& after) {
    if (!before.valid || !after.valid || after.total <= before.total) return 0.0;
    double totalDelta = static_cast<double>(after.total - before.total);
    double idleDelta = after.idle >= before.idle ? static_cast<double>(after.idle - before.idle) : 0.0;
    double usage = (1.0 - idleDelta / totalDelta) * 100.0;
    if (usage < 0.0) return 0.0;
    if (usage > 100.0) return 100.0;
    return usage;
}

bool PlatformUtils::releaseFreeMemory() {
#if defined(__linux__) && defined(__GLIBC__)
    return malloc_trim(0) != 0;
#else
    return false;
#endif
}

} // namespace lockerfetch::utils
