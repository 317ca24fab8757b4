/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include "file.hpp"

namespace verichain::file {
    std::string install_path(const std::string_view rel_path)
    {
        if (!rel_path.empty() && std::filesystem::path { rel_path }.is_absolute())
            return std::string { rel_path };
        return fmt::format("./{}", rel_path);
    }

    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for reading", path));
        std::ostringstream ss {};
        ss << is.rdbuf();
        if (is.bad()) [[unlikely]]
            throw error_sys(fmt::format("failed to read from {}", path));
        return std::move(ss).str();
    }

    void write(const std::string &path, const buffer data)
    {
        if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
            std::filesystem::create_directories(parent);
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os) [[unlikely]]
            throw error_sys(fmt::format("failed to open {} for writing", path));
        os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!os) [[unlikely]]
            throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), path));
    }

    static std::string tmp_path(const std::string_view name)
    {
        // the pid keeps parallel test runs on the same machine apart
        return (std::filesystem::temp_directory_path() / fmt::format("verichain-{}-{}", ::getpid(), name)).string();
    }

    tmp::tmp(const std::string_view name):
        _path { tmp_path(name) }
    {
        std::filesystem::remove(_path);
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { tmp_path(name) }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::~tmp_directory()
    {
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
    }
}
