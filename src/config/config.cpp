#include "config.hpp"

#include <iostream>
#include <vector>
#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../utils/logger.hpp"
#include "../utils/system.hpp"
#include "../utils/utils.hpp"

#include "../core/parse/timestamp.hpp"

using json = nlohmann::json;

#ifndef NDEBUG
#define DEFAULT_VERBOSITY "true"
#else
#define DEFAULT_VERBOSITY "false"
#endif

#define DEFAULT_CONFIG_NAME "ngxparse.json"

namespace config {

Config &Get() {
    static Config instance;
    return instance;
}

void Reset() {
    Config &config = Get();
    config.input_file.clear();
    config.output_file.clear();
    config.strict = false;
    config.require_unprivileged = false;
    config.verbose_logs = false;
    config.color = false;
    config.filters = FilterConfig{};
    config.output = ExportConfig{};
}

std::optional<SortKey> SortKeyFromString(const std::string &str) {
    for (const auto &[key, name] : SortKeyName) {
        if (name == str) return key;
    }

    return std::nullopt;
}

std::optional<OutputFormat> OutputFormatFromString(const std::string &str) {
    for (const auto &[format, name] : OutputFormatName) {
        if (name == utils::ToLower(str)) return format;
    }

    return std::nullopt;
}

std::vector<std::string> ExpandMultiValueArgs(
    const std::vector<std::string> &args,
    const std::vector<std::string> &multi_value_flags) {
    std::vector<std::string> res;
    res.reserve(args.size());

    for (usize i = 0; i < args.size(); i++) {
        const auto &arg = args[i];
        if (i == 0 || !utils::contains(multi_value_flags, arg)) {
            res.push_back(arg);
            continue;
        }

        usize values = 0;
        while (i + 1 < args.size() &&
               (args[i + 1].empty() || args[i + 1].front() != '-' ||
                args[i + 1] == "-")) {
            res.push_back(arg + "=" + args[++i]);
            values++;
        }
        if (values == 0) {
            res.push_back(arg);
        }
    }

    return res;
}

static Err ParseTimeBound(const std::string &option, const std::string &text,
                          std::optional<TimePoint> &bound) {
    auto parsed = core::parse::ParseIsoUtc(text);
    if (!parsed) {
        logger::Error("Invalid %s time `%s`, expected ISO-8601 like "
                      "2021-04-26T21:20:00Z",
                      option.c_str(), text.c_str());
        return Err::InvalidArguments;
    }
    bound = parsed;
    return Err::Ok;
}

template <typename T>
static Err ReadValue(const json &data, const char *key, T &out) {
    try {
        out = data.at(key).get<T>();
    } catch (const json::exception &e) {
        logger::Error("Config option `%s`: %s", key, e.what());
        return Err::InvalidConfigFormat;
    }
    return Err::Ok;
}

Err LoadDefaults(const std::string &filename, Config &config) {
    logger::Debug("Loading defaults from `%s`", filename.c_str());
    std::ifstream in(filename);
    if (!in.is_open()) {
        return Err::FileNotFound;
    }

    json data;
    try {
        in >> data;
    } catch (const std::exception &e) {
        logger::Error("%s", e.what());
        return Err::InvalidConfigFormat;
    }

    if (!data.is_object()) {
        logger::Error("Top level of %s must be an object", filename.c_str());
        return Err::InvalidConfigFormat;
    }

    Err err{};
    for (const auto &item : data.items()) {
        const std::string &key = item.key();
        if (key == "status") {
            err = ReadValue(data, "status", config.filters.statuses);
        } else if (key == "method") {
            err = ReadValue(data, "method", config.filters.methods);
        } else if (key == "path_contains") {
            err = ReadValue(data, "path_contains", config.filters.path_contains);
        } else if (key == "ip") {
            err = ReadValue(data, "ip", config.filters.ips);
        } else if (key == "since" || key == "until") {
            std::string text;
            err = ReadValue(data, key.c_str(), text);
            if (err == Err::Ok) {
                err = ParseTimeBound(key, text,
                                     key == "since" ? config.filters.since
                                                    : config.filters.until);
                if (err != Err::Ok) err = Err::InvalidConfigFormat;
            }
        } else if (key == "sort_by") {
            std::string name;
            err = ReadValue(data, "sort_by", name);
            if (err == Err::Ok) {
                auto sort_key = SortKeyFromString(name);
                if (!sort_key) {
                    logger::Error("Unknown sort key `%s`", name.c_str());
                    return Err::InvalidConfigFormat;
                }
                config.output.sort_by = *sort_key;
            }
        } else if (key == "desc") {
            err = ReadValue(data, "desc", config.output.descending);
        } else if (key == "limit") {
            i64 limit{};
            err = ReadValue(data, "limit", limit);
            if (err == Err::Ok) config.output.limit = limit;
        } else if (key == "strict") {
            err = ReadValue(data, "strict", config.strict);
        } else if (key == "format") {
            std::string name;
            err = ReadValue(data, "format", name);
            if (err == Err::Ok) {
                auto format = OutputFormatFromString(name);
                if (!format) {
                    logger::Error("Unknown output format `%s`", name.c_str());
                    return Err::InvalidConfigFormat;
                }
                config.output.format = *format;
            }
        } else {
            logger::Error("Unknown option `%s` in %s", key.c_str(),
                          filename.c_str());
            return Err::UnknownConfigOption;
        }

        if (err != Err::Ok) {
            return err;
        }
    }

    logger::Okay("Loaded defaults from %s", filename.c_str());
    return err;
}

Err InitFromArgs(int argc, const char *const *argv) {
    Reset();
    Config &config = Get();

    cxxopts::Options options("ngxparse",
                             "Parse nginx access log (ingress-style) and "
                             "export to CSV.");

    // clang-format off
    options.add_options()
        ("i,input", "Path to nginx log file, `-` for stdin", cxxopts::value<std::string>())
        ("o,output", "Path to output file, `-` for stdout", cxxopts::value<std::string>())
        ("status", "Keep only these HTTP statuses, e.g. --status 200 404", cxxopts::value<std::vector<i64>>())
        ("method", "Keep only these methods, e.g. --method GET POST", cxxopts::value<std::vector<std::string>>())
        ("path-contains", "Keep only rows where path contains substring", cxxopts::value<std::string>())
        ("ip", "Keep only these client IPs", cxxopts::value<std::vector<std::string>>())
        ("since", "Start time (UTC) like 2021-04-26T21:20:00Z", cxxopts::value<std::string>())
        ("until", "End time (UTC) like 2021-04-26T21:30:00Z", cxxopts::value<std::string>())
        ("sort-by",
         "Sort output by column (time_utc, status, request_time, "
         "body_bytes_sent, upstream_response_time)",
         cxxopts::value<std::string>())
        ("desc", "Sort descending", cxxopts::value<bool>())
        ("limit", "Write only first N rows after filtering/sorting", cxxopts::value<i64>())
        ("strict", "Fail if any line doesn't match expected format", cxxopts::value<bool>())
        ("f,format", "Output format (csv, jsonl)", cxxopts::value<std::string>())
        ("config", "Path to .json file with default option values", cxxopts::value<std::string>())
        ("require-unprivileged", "Refuse to run as an administrative user", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "Print usage")
        ("v,verbose", "Enable verbose output", cxxopts::value<bool>()->default_value(DEFAULT_VERBOSITY))
        ("q,quiet", "Disable verbose output", cxxopts::value<bool>())
        ("no-color", "Disable colored diagnostics", cxxopts::value<bool>())
    ;
    // clang-format on

    std::vector<std::string> raw_args(argv, argv + argc);
    auto args = ExpandMultiValueArgs(raw_args, {"--status", "--method", "--ip"});
    std::vector<const char *> expanded_argv;
    expanded_argv.reserve(args.size());
    for (const auto &arg : args) {
        expanded_argv.push_back(arg.c_str());
    }

    try {
        auto result = options.parse(static_cast<int>(expanded_argv.size()),
                                    expanded_argv.data());

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            exit(0);
        }

        config.verbose_logs =
            result["verbose"].as<bool>() && !result.count("quiet");
        config.color = !result.count("no-color") && utils::IsTerminal(2);
        config.require_unprivileged = result["require-unprivileged"].as<bool>();

        if (!result.unmatched().empty()) {
            logger::Error("unrecognized arguments: %s",
                          result.unmatched().front().c_str());
            return Err::InvalidArguments;
        }

        if (result.count("config")) {
            auto filename = result["config"].as<std::string>();
            Err err = LoadDefaults(filename, config);
            if (err != Err::Ok) {
                logger::Error("Load of config file `%s` failed",
                              filename.c_str());
                logger::Error(ErrorText[static_cast<int>(err)]);
                return err == Err::FileNotFound ? Err::InvalidArguments : err;
            }
        } else {
            auto filename = (std::filesystem::path(utils::GetDefaultPath()) /
                             DEFAULT_CONFIG_NAME)
                                .string();
            if (std::filesystem::exists(filename)) {
                Err err = LoadDefaults(filename, config);
                if (err != Err::Ok) {
                    logger::Error("Load of config file `%s` failed",
                                  filename.c_str());
                    return err;
                }
            }
        }

        if (!result.count("input") || !result.count("output")) {
            logger::Error(
                "the following arguments are required: -i/--input, "
                "-o/--output");
            std::cerr << "Use -h to view available options\n";
            return Err::InvalidArguments;
        }
        config.input_file = result["input"].as<std::string>();
        config.output_file = result["output"].as<std::string>();

        if (result.count("status")) {
            config.filters.statuses = result["status"].as<std::vector<i64>>();
        }
        if (result.count("method")) {
            config.filters.methods =
                result["method"].as<std::vector<std::string>>();
        }
        if (result.count("path-contains")) {
            config.filters.path_contains =
                result["path-contains"].as<std::string>();
        }
        if (result.count("ip")) {
            config.filters.ips = result["ip"].as<std::vector<std::string>>();
        }
        for (const char *bound : {"since", "until"}) {
            if (!result.count(bound)) continue;
            Err err = ParseTimeBound(bound, result[bound].as<std::string>(),
                                     std::string(bound) == "since"
                                         ? config.filters.since
                                         : config.filters.until);
            if (err != Err::Ok) return err;
        }

        if (result.count("sort-by")) {
            auto name = result["sort-by"].as<std::string>();
            auto sort_key = SortKeyFromString(name);
            if (!sort_key) {
                logger::Error("argument --sort-by: invalid choice: `%s`",
                              name.c_str());
                return Err::InvalidArguments;
            }
            config.output.sort_by = *sort_key;
        }
        if (result.count("desc")) {
            config.output.descending = result["desc"].as<bool>();
        }
        if (result.count("limit")) {
            config.output.limit = result["limit"].as<i64>();
        }
        if (result.count("strict")) {
            config.strict = result["strict"].as<bool>();
        }
        if (result.count("format")) {
            auto name = result["format"].as<std::string>();
            auto format = OutputFormatFromString(name);
            if (!format) {
                logger::Error("argument --format: invalid choice: `%s`",
                              name.c_str());
                return Err::InvalidArguments;
            }
            config.output.format = *format;
        }

        logger::Debug("Input: %s", config.input_file.c_str());
        logger::Debug("Output: %s (%s)", config.output_file.c_str(),
                      OutputFormatName.at(config.output.format).c_str());
        logger::Debug("Sort by %s%s",
                      SortKeyName.at(config.output.sort_by).c_str(),
                      config.output.descending ? " descending" : "");

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use -h to view available options\n";
        return Err::InvalidArguments;
    }

    return Err::Ok;
}
}  // namespace config
