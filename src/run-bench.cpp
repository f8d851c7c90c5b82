/* This file is part of Errata project
 * Copyright (c) 2025 Errata authors
 * This code is distributed under the license specified in:
 * LICENSE */

#include <iostream>
#include <errata/logger.hpp>
#include <errata/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace errata;
    if (argc >= 2) {
        std::cerr << "using benchmark-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool failed = boost::ut::cfg<boost::ut::override>.run();
    logger::info("run-bench finished with {}", failed ? "failures" : "success");
    return failed ? 1 : 0;
}
