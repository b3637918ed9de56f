#pragma once

#include <relay/config.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <random>
#include <string>
#include <sys/stat.h>

namespace relay::test
{

// Scratch directory holding fake CLI scripts; removed on destruction
class ScratchDir
{
  public:
    ScratchDir()
    {
        namespace fs = std::filesystem;
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("claude_relay_test-" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const
    {
        return path_;
    }

    // Write an executable /bin/sh script and return its path
    std::string write_script(const std::string& name, const std::string& body) const
    {
        auto file = path_ / name;
        {
            std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
            ofs << "#!/bin/sh\n" << body << "\n";
        }
        ::chmod(file.c_str(), 0755);
        return file.string();
    }

    std::string file_path(const std::string& name) const
    {
        return (path_ / name).string();
    }

  private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::string& path)
{
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline RelayConfig config_for(const std::string& cli_path)
{
    RelayConfig config;
    config.cli_path = cli_path;
    config.search_path = "/usr/bin:/bin";
    return config;
}

} // namespace relay::test
