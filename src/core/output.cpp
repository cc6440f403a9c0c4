#include "output.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>

#include "../utils/logger.hpp"

namespace core::output {
std::string DisplayPath(const std::string &path) {
    if (path == "-") return path;

    std::filesystem::path res;
    for (const auto &part : std::filesystem::path(path)) {
        if (part.empty() || part == ".") continue;
        res /= part;
    }
    return res.empty() ? "." : res.string();
}

void PrintSummary(const RunSummary &summary, bool to_stderr) {
    std::ostream &out = to_stderr ? std::cerr : std::cout;
    out << "OK: parsed=" << summary.written
        << " rows, skipped_bad_lines=" << summary.bad_lines
        << ", output=" << DisplayPath(summary.output) << std::endl;
}

void PrintStatusBreakdown(const std::vector<AccessRecord> &records) {
    std::map<i64, u64> classes;
    for (const auto &record : records) {
        classes[record.status.value_or(0) / 100]++;
    }

    bool color = config::Get().color;
    std::cerr << "=== Status classes [" << records.size() << " rows] ===\n";
    for (const auto &[status_class, count] : classes) {
        if (color) {
            if (status_class >= 5) {
                std::cerr << COLOR_RED;
            } else if (status_class == 4) {
                std::cerr << COLOR_YELLOW;
            } else if (status_class == 2) {
                std::cerr << COLOR_GREEN;
            }
        }
        std::cerr << "\t" << status_class << "xx " << std::right
                  << std::setw(10) << count << "\n";
        if (color) std::cerr << COLOR_RESET;
    }
}
}  // namespace core::output
