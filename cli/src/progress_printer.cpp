#include "progress_printer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {
constexpr int BAR_WIDTH = 30;
}

ProgressPrinter::ProgressPrinter(std::ostream& out) : out_(out) {
}

void ProgressPrinter::update(const std::string& group, std::uint64_t done, std::uint64_t total) {
    std::lock_guard<std::mutex> lock(mu_);

    int percent = total == 0 ? 100 : static_cast<int>(std::min<std::uint64_t>(done * 100 / total, 100));
    if(group == current_group_ && percent == last_percent_) {
        return;
    }
    current_group_ = group;
    last_percent_ = percent;

    int filled = percent * BAR_WIDTH / 100;
    out_ << '\r' << group << " [" << std::string(filled, '#') << std::string(BAR_WIDTH - filled, ' ') << "] "
         << std::setw(3) << percent << "% " << format_bytes(done) << "/" << format_bytes(total) << std::flush;
}

void ProgressPrinter::state_changed(const std::string& group, transfer::GroupState state) {
    std::lock_guard<std::mutex> lock(mu_);

    if(state == transfer::GroupState::IN_PROGRESS) {
        current_group_ = group;
        last_percent_ = -1;
        return;
    }
    if(current_group_ == group && last_percent_ >= 0) {
        out_ << std::endl;
    }
    current_group_.clear();
    last_percent_ = -1;
}

std::string ProgressPrinter::format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        unit++;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << ' ' << units[unit];
    return out.str();
}
