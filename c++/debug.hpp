#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-copy"
#pragma GCC diagnostic ignored "-Wstrict-aliasing"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "cpp-btree/btree_map.h"
#pragma GCC diagnostic pop

constexpr const char* DEBUG_LOG_FILE = "debug.txt";

// Silent until a program opens it.
inline std::ofstream debug;

inline void open_debug_log(const std::string& path = DEBUG_LOG_FILE) {
    debug.open(path);
}


namespace timer {
    inline btree::btree_map<std::string, decltype(std::chrono::steady_clock::now())> begin_time;
    inline void start(const std::string& s) {
        begin_time[s] = std::chrono::steady_clock::now();
    }
    inline double elapsed(const std::string& s) {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - begin_time[s]).count();
    }
    inline void end(const std::string& s) {
        debug << s << ": " << elapsed(s) << "s\n";
    }
}

inline uint64_t get_used_RAM() { // in Mb
    std::ifstream proc("/proc/self/status");
    for(std::string s; proc >> s; ) {
        if(s == "VmRSS:") {
            uint64_t ram;
            proc >> ram;
            return ram / 1024;
        }
    }
    return 0;
}
