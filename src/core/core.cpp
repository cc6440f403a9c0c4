#include "core.hpp"

#include <fstream>
#include <iostream>
#include <vector>

#include "../utils/logger.hpp"
#include "../config/config.hpp"

#include "../common/pre_checks.hpp"

#include "filter/filter.hpp"
#include "output.hpp"
#include "parse/line_parser.hpp"
#include "sort/sort.hpp"

namespace core {
static bool IsStdStream(const std::string &path) { return path == "-"; }

Err Init() {
    const auto &conf = config::Get();

    Err err = pre_checks::RunningUnprivileged(conf.require_unprivileged);
    if (err != Err::Ok) {
        return err;
    }

    if (!IsStdStream(conf.input_file)) {
        err = pre_checks::FileExists(conf.input_file.c_str());
        if (err != Err::Ok) {
            return err;
        }
        logger::Okay("Found input '%s'", conf.input_file.c_str());
    }

    return err;
}

Err Collect(std::istream &in, std::vector<AccessRecord> &records,
            RunSummary &summary) {
    const auto &conf = config::Get();

    parse::ParseStats stats{};
    bool filtering = !filter::IsEmpty(conf.filters);

    Err err = parse::ParseStream(
        in, conf.strict,
        [&](AccessRecord &&record) {
            if (!filtering || filter::Matches(record, conf.filters)) {
                records.push_back(std::move(record));
            }
        },
        stats);
    summary.bad_lines = stats.bad_lines;
    if (err != Err::Ok) {
        return err;
    }

    logger::Debug("Read %llu lines, %llu records, %llu kept",
                  static_cast<unsigned long long>(stats.lines),
                  static_cast<unsigned long long>(stats.records),
                  static_cast<unsigned long long>(records.size()));
    if (stats.bad_lines) {
        logger::Warn("Skipped %llu malformed lines",
                     static_cast<unsigned long long>(stats.bad_lines));
    }

    sort::SortRecords(records, conf.output.sort_by, conf.output.descending);
    sort::ApplyLimit(records, conf.output.limit);

    if (conf.verbose_logs) {
        output::PrintStatusBreakdown(records);
    }

    return err;
}

Err Export(const std::vector<AccessRecord> &records, writer::Writer &out,
           RunSummary &summary) {
    Err err = out.Begin();
    if (err != Err::Ok) {
        return err;
    }
    for (const auto &record : records) {
        err = out.Write(record);
        if (err != Err::Ok) {
            return err;
        }
        summary.written++;
    }
    return out.Finish();
}

Err Process(std::istream &in, writer::Writer &out, RunSummary &summary) {
    std::vector<AccessRecord> records;
    Err err = Collect(in, records, summary);
    if (err != Err::Ok) {
        return err;
    }
    return Export(records, out, summary);
}

Err Run() {
    const auto &conf = config::Get();
    RunSummary summary{.output = conf.output_file};

    std::ifstream in_file;
    std::istream *in = &std::cin;
    if (!IsStdStream(conf.input_file)) {
        in_file.open(conf.input_file, std::ios::binary);
        if (!in_file.is_open()) {
            logger::Error("input not found: %s", conf.input_file.c_str());
            return Err::FileNotFound;
        }
        in = &in_file;
    }

    // The output is only touched once the whole input parsed cleanly.
    std::vector<AccessRecord> records;
    Err err = Collect(*in, records, summary);
    if (err != Err::Ok) {
        return err;
    }

    std::ofstream out_file;
    std::ostream *out = &std::cout;
    if (!IsStdStream(conf.output_file)) {
        err = writer::OpenOutput(conf.output_file, out_file);
        if (err != Err::Ok) {
            return err;
        }
        out = &out_file;
    }

    auto writer = writer::MakeWriter(conf.output.format, *out);
    err = Export(records, *writer, summary);
    if (err != Err::Ok) {
        logger::Error(ErrorText[static_cast<int>(err)]);
        return err;
    }

    output::PrintSummary(summary, IsStdStream(conf.output_file));
    return err;
}
}  // namespace core
