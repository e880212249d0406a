#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>
#include "core/airport_database.hpp"
#include "logging/logger.hpp"

#ifndef BOARDING_PASS_SOURCE_DIR
#define BOARDING_PASS_SOURCE_DIR "."
#endif

/**
 * @brief Base class for tests that need the airport dataset or scratch files
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        airports_ = std::make_shared<AirportDatabase>();
        ASSERT_TRUE(airports_->loadFromFile(sourcePath("data/airports.json")))
            << "airport dataset missing under " << BOARDING_PASS_SOURCE_DIR;

        test_files_dir_ = std::filesystem::temp_directory_path() /
                          ("boarding_pass_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(test_files_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_files_dir_, ec);
    }

    static std::string sourcePath(const std::string &relative)
    {
        return (std::filesystem::path(BOARDING_PASS_SOURCE_DIR) / relative).string();
    }

    // Helper to create a scratch file for tests
    std::string createFile(const std::string &filename, const std::string &content)
    {
        std::filesystem::path file_path = test_files_dir_ / filename;
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    std::string getTestFilesDir() const { return test_files_dir_.string(); }

    std::shared_ptr<AirportDatabase> airports_;

private:
    std::filesystem::path test_files_dir_;
};
