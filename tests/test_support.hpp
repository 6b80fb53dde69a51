#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include "config/option.hpp"

namespace fs = std::filesystem;

// 每个测试独占一个临时目录，结束时删除
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::random_device rd;
        dir = fs::temp_directory_path() /
              ("confgen_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
               std::to_string(rd()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string path(const std::string& name) const { return (dir / name).string(); }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream ofs(path(name), std::ios::binary | std::ios::trunc);
        ofs << content;
    }

    std::string read(const std::string& name) const {
        std::ifstream ifs(path(name), std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }

    fs::path dir;
};

inline config::ConfigOption make_option(const std::string& name, const std::string& description,
                                        const std::string& type, const std::string& default_value) {
    config::ConfigOption option;
    option.name = name;
    option.description = description;
    option.type = type;
    option.default_value = default_value;
    return option;
}

// {a: bool = false, b: usize = 0}
inline config::ConfigOptions sample_options() {
    return {
        make_option("a", "desc a", "bool", "false"),
        make_option("b", "desc b", "usize", "0"),
    };
}

inline const char* sample_descriptor_json() {
    return R"({
    "options": [
        {"name": "a", "description": "desc a", "type": "bool", "default": "false"},
        {"name": "b", "description": "desc b", "type": "usize", "default": "0"}
    ]
})";
}
