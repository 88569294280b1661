// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_info.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <sys/utsname.h>
#include <unistd.h>

namespace devbridge {

std::string detect_platform() {
#if defined(__ANDROID__)
    return "android";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

std::string host_name() {
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return buf;
}

json collect_device_info(const std::string& device_id) {
    json info;
    info["deviceId"] = device_id;
    info["platform"] = detect_platform();
    info["hostname"] = host_name();
    info["pid"] = static_cast<int64_t>(getpid());

    struct utsname uts {};
    if (uname(&uts) == 0) {
        info["os"] = {{"name", uts.sysname},
                      {"release", uts.release},
                      {"version", uts.version},
                      {"machine", uts.machine}};
    } else {
        spdlog::warn("[Device Info] uname() failed");
        info["os"] = nullptr;
    }

    // Total RAM from /proc/meminfo (Linux only)
    FILE* f = fopen("/proc/meminfo", "r");
    if (f) {
        unsigned long mem_total_kb = 0;
        if (fscanf(f, "MemTotal: %lu kB", &mem_total_kb) == 1 && mem_total_kb > 0) {
            info["memoryMb"] = mem_total_kb / 1024;
        }
        fclose(f);
    }
    return info;
}

} // namespace devbridge
