#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <filesystem>
#include <string>
#include <string_view>
#include "bytes.hpp"

namespace verichain::file {
    extern std::string install_path(std::string_view rel_path);
    extern std::string read(const std::string &path);
    extern void write(const std::string &path, buffer data);

    // A file path inside the system's temporary directory that is removed when the object goes out of scope.
    struct tmp {
        explicit tmp(const std::string_view name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // Creates an empty directory inside the system's temporary directory and removes it with all its contents on destruction.
    struct tmp_directory {
        explicit tmp_directory(const std::string_view name);
        ~tmp_directory();

        tmp_directory(const tmp_directory &) =delete;
        tmp_directory &operator=(const tmp_directory &) =delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        operator std::filesystem::path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
