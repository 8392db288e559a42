/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logger.cpp
 * ============================================================================
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ppl {

namespace {
    std::deque<std::string> system_logs;
    std::mutex log_mutex;
    std::size_t log_capacity = 200;
}

void ppl_log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    while (!system_logs.empty() && system_logs.size() >= log_capacity) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    if (log_capacity > 0) system_logs.push_back(log_entry);

    std::cout << log_entry << std::endl;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void set_log_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_capacity = capacity;
    while (system_logs.size() > log_capacity) {
        system_logs.pop_front();
    }
}

} // namespace ppl
