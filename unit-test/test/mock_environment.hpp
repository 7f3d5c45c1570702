#pragma once

#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <string>
#include "validation/bitcode_environment.hpp"

namespace difftest::test {

/**
 * @brief 记录调用的环境，默认行为委托给 bitcode_environment
 */
struct mock_environment : public environment {
    bitcode_environment real;

    mock_environment(const std::string &name,
                     const std::filesystem::path &original,
                     const std::filesystem::path &current,
                     const std::filesystem::path &workdir);

    MOCK_METHOD(std::string, benchmark, (), (const, override));
    MOCK_METHOD(void, reset, (const std::string &benchmark), (override));
    MOCK_METHOD(void, write_bitcode, (const std::filesystem::path &path), (override));
    MOCK_METHOD(std::unique_ptr<environment>, fork, (), (override));
    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(std::filesystem::path, working_dir, (), (const, override));
};

}  // namespace difftest::test
