#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include "transfer/records.hpp"

// One progress line per group, redrawn in place. Safe to call from worker threads.
class ProgressPrinter {
public:
    explicit ProgressPrinter(std::ostream& out = std::cout);

    void update(const std::string& group, std::uint64_t done, std::uint64_t total);
    void state_changed(const std::string& group, transfer::GroupState state);

private:
    std::ostream& out_;
    std::mutex mu_;
    std::string current_group_;
    int last_percent_ = -1;

    static std::string format_bytes(std::uint64_t bytes);
};
