/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <ecefsez.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

/** Program entry point */
int main(int argc, char* argv[]) {
    // Results go to stdout, so log messages must go somewhere else
    spdlog::set_default_logger(spdlog::stderr_color_mt("ecefsez"));
    spdlog::set_pattern("[%^%l%$] %v");

    std::vector<std::string> args(argv + 1, argv + argc);
    return ecefsez::run(args);
}
