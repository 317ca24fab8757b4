/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace verichain;
    return cli::run(argc, argv);
}
