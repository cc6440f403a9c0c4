#ifndef TESTS_FIXTURES_HPP
#define TESTS_FIXTURES_HPP

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include "../src/core/writer/writer.hpp"

class MockWriter : public core::writer::Writer {
public:
    MOCK_METHOD0(Begin, Err());
    MOCK_METHOD1(Write, Err(const core::AccessRecord &record));
    MOCK_METHOD0(Finish, Err());
};

struct LineFields {
    std::string remote_addr = "10.0.0.1";
    std::string time_local = "26/Apr/2021:21:20:17 +0000";
    std::string request = "GET /api/items?id=7&sort=asc HTTP/2.0";
    std::string status = "200";
    std::string body_bytes_sent = "512";
    std::string referer = "-";
    std::string user_agent = "curl/7.68.0";
    std::string request_length = "120";
    std::string request_time = "0.004";
    std::string upstream_name = "default-api-80";
    std::string upstream_alternative = "";
    std::string upstream_addr = "10.1.0.5:8080";
    std::string upstream_response_length = "512";
    std::string upstream_response_time = "0.004";
    std::string upstream_status = "200";
    std::string request_id = "a1b2c3";
};

inline std::string MakeLine(const LineFields &f = {}) {
    return f.remote_addr + " - - [" + f.time_local + "] \"" + f.request +
           "\" " + f.status + " " + f.body_bytes_sent + " \"" + f.referer +
           "\" \"" + f.user_agent + "\" " + f.request_length + " " +
           f.request_time + " [" + f.upstream_name + "] [" +
           f.upstream_alternative + "] " + f.upstream_addr + " " +
           f.upstream_response_length + " " + f.upstream_response_time + " " +
           f.upstream_status + " " + f.request_id;
}

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("ngxparse_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::string Write(const std::string &name,
                      const std::string &content) const {
        auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.string();
    }

    static std::string Read(const std::string &file) {
        std::ifstream in(file, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path path_;
};

#endif
