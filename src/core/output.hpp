#ifndef CORE_OUTPUT_HPP
#define CORE_OUTPUT_HPP

#include <string>
#include <vector>

#include "core.hpp"
#include "record.hpp"

namespace core::output {
// Path as shown to the user: repeated separators and "." components are
// collapsed, a trailing separator is dropped.
std::string DisplayPath(const std::string &path);

// Final "OK: ..." line. Goes to stderr when stdout carries the export.
void PrintSummary(const RunSummary &summary, bool to_stderr);

// Per status class counts of the exported records.
void PrintStatusBreakdown(const std::vector<AccessRecord> &records);
}  // namespace core::output

#endif
