/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ECEFSEZ_CLI_HPP
#define __ECEFSEZ_CLI_HPP

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <ecefsez/config.hpp>

namespace ecefsez {

constexpr const char* USAGE =
    "Usage: ecefsez [OPTIONS] o_x_km o_y_km o_z_km x_km y_km z_km";

// Number of positional values on the command line
constexpr std::size_t COORDINATE_COUNT = 6;

// ============================================================================
// Input Exception Classes
// ============================================================================

/**
 * Base exception class for malformed command line input.
 */
class InputException : public std::runtime_error {
public:
    explicit InputException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when the wrong number of coordinates is given.
 */
class UsageException : public InputException {
public:
    explicit UsageException(std::size_t count)
        : InputException("Expected " + std::to_string(COORDINATE_COUNT) +
                         " coordinates, got " + std::to_string(count)) {}
};

/**
 * Exception thrown when a coordinate is not a finite base-10 number.
 */
class InvalidCoordinateException : public InputException {
public:
    explicit InvalidCoordinateException(const std::string& text)
        : InputException("Invalid coordinate: \"" + text + "\"") {}
};

// ============================================================================
// Command Line Functions
// ============================================================================

/**
 * Parses a single coordinate in kilometers.
 *
 * Surrounding whitespace and a single leading '+' are accepted. The rest of
 * the text must be a finite floating point literal.
 *
 * @throws InvalidCoordinateException if the text is not a finite number
 */
double parseCoordinate(std::string_view text);

/**
 * Stores the six positional values in the config: the observer first,
 * then the target (or the SEZ displacement when inverse mode is set).
 *
 * The count is checked before any value is parsed.
 *
 * @throws UsageException if there are not exactly six values
 * @throws InvalidCoordinateException if a value is not a finite number
 */
void parseCoordinates(const std::vector<std::string> &values, Config &config);

/**
 * Formats a value for output. Without a precision the shortest
 * representation that round-trips is used.
 */
std::string formatValue(double value, std::optional<int> precision = std::nullopt);

/**
 * Runs the command line program.
 *
 * @param args Command line arguments, without the program name
 * @param out Receives results, usage and help
 * @param err Receives error messages
 * @return Process exit code
 */
int run(const std::vector<std::string> &args, std::ostream &out = std::cout, std::ostream &err = std::cerr);

}

#endif
