#pragma once

// Shared helpers for the checker tests: a scratch directory that removes
// itself, and issue lookups by message.

#include <gtest/gtest.h>
#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "analysis_types.hh"

namespace GCodeCheckTest
{
  class TempDir
  {
  public:
    TempDir()
    {
      static int counter = 0;
      const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
      std::string name = "gcode_check_" + std::to_string(getpid()) + "_" +
                         std::to_string(counter++) + "_" + (info ? info->name() : "test");
      path_ = std::filesystem::temp_directory_path() / name;
      std::filesystem::remove_all(path_);
      std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::string write(const std::string &name, const std::string &content) const
    {
      std::filesystem::path file = path_ / name;
      std::ofstream out(file, std::ios::binary);
      out << content;
      return file.string();
    }

  private:
    std::filesystem::path path_;
  };

  inline size_t countMessage(const std::vector<GCodeCheck::Issue> &issues, const std::string &message)
  {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                             [&](const GCodeCheck::Issue &i)
                                             { return i.message == message; }));
  }

  inline const GCodeCheck::Issue *findMessage(const std::vector<GCodeCheck::Issue> &issues,
                                              const std::string &message)
  {
    for (const auto &issue : issues)
    {
      if (issue.message == message)
        return &issue;
    }
    return nullptr;
  }
}
