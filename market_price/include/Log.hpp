#pragma once
#include <iostream>
#include <mutex>
#include <string>

// ---- Logging (avoid interleaved prints from socket I/O threads) ----
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline void log_info(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cout << "[" << tag << "] " << msg << "\n";
}

inline void log_error(const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << "[" << tag << "] " << msg << std::endl;
}
