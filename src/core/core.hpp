#ifndef CORE_HPP
#define CORE_HPP

#include <istream>
#include <string>
#include <vector>

#include "../utils/errors.hpp"
#include "writer/writer.hpp"

namespace core {
struct RunSummary {
    u64 written{};
    u64 bad_lines{};
    std::string output{};
};

Err Init();
Err Run();

// Parses `in` into `records`, dropping filtered rows, then sorts and limits
// them according to the active config.
Err Collect(std::istream &in, std::vector<AccessRecord> &records,
            RunSummary &summary);
Err Export(const std::vector<AccessRecord> &records, writer::Writer &out,
           RunSummary &summary);

// Parses `in`, filters, sorts and limits the records according to the active
// config and hands the survivors to `out`.
Err Process(std::istream &in, writer::Writer &out, RunSummary &summary);
}  // namespace core

#endif
