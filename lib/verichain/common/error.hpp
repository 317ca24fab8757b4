#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <stdexcept>
#include <string>
#include <string_view>

namespace verichain {
    struct base_error: std::exception {
        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
    private:
        std::string _msg;
    };

    struct error: base_error {
        explicit error(std::string_view msg);
        explicit error(std::string_view msg, const std::exception &ex);
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);
    };
}
