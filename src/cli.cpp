/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <ecefsez/cli.hpp>
#include <ecefsez/topocentric.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <format>

using spdlog::debug;
using spdlog::warn;

namespace ecefsez {

// Helper function to trim leading and trailing whitespace from a string_view
static std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

double parseCoordinate(std::string_view text) {
    auto str = trim(text);

    // from_chars doesn't accept a leading plus sign
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
        if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
            throw InvalidCoordinateException(std::string(text));
        }
    }

    double value = 0.0;
    const char *end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (ec == std::errc::result_out_of_range && ptr == end) {
        // from_chars leaves the value unset on underflow, strtod rounds it toward zero
        std::string copy(str);
        char *strtodEnd = nullptr;
        value = std::strtod(copy.c_str(), &strtodEnd);
        ec = std::errc();
        if (strtodEnd != copy.c_str() + copy.size()) {
            ec = std::errc::invalid_argument;
        }
    }
    if (str.empty() || ec != std::errc() || ptr != end || !std::isfinite(value)) {
        throw InvalidCoordinateException(std::string(text));
    }
    return value;
}

void parseCoordinates(const std::vector<std::string> &values, Config &config) {
    if (values.size() != COORDINATE_COUNT) {
        throw UsageException(values.size());
    }

    double v[COORDINATE_COUNT];
    for (std::size_t i = 0; i < COORDINATE_COUNT; ++i) {
        v[i] = parseCoordinate(values[i]);
    }

    config.setObserver({v[0], v[1], v[2]});
    config.setTarget({v[3], v[4], v[5]});
}

std::string formatValue(double value, std::optional<int> precision) {
    if (precision.has_value()) {
        return std::format("{:.{}f}", value, *precision);
    }
    return std::format("{}", value);
}

static void logObserver(const Vec3 &observer) {
    if (isDegenerateObserver(observer)) {
        warn("Observer is at the ECEF origin, the local frame is undefined");
    }
    Geocentric geo = ecefToGeocentric(observer);
    debug("Observer geocentric latitude: {:.6f} deg, longitude: {:.6f} deg",
        geo.latInDegrees(), geo.lonInDegrees());
}

static void logLookAngles(const SEZ &sez) {
    debug("Range: {:.3f} km, elevation: {:.3f} deg",
        sez.range(), sez.elevationInRadians() * RADIANS_TO_DEGREES);
}

// CLI11 only reads "-<digit>..." as a value, so "-.5" would be taken for a short option
static std::string normalizeNegative(const std::string &arg) {
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '.' && std::isdigit(static_cast<unsigned char>(arg[2]))) {
        return "-0" + arg.substr(1);
    }
    return arg;
}

/** Runs the program against explicit arguments and streams */
int run(const std::vector<std::string> &args, std::ostream &out, std::ostream &err) {
    Config config;

    CLI::App app{"Converts an ECEF position to an observer's South-East-Zenith frame", "ecefsez"};

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");
    app.add_flag_function("--inverse",
        [&config](const int64_t v) { config.setInverse(v > 0); },
        "Treat the last three values as south, east and zenith (km) and print the ECEF position");
    app.add_option_function<int>("--precision",
        [&config](const int digits) { config.setPrecision(digits); },
        "Print values with this many decimals (default: shortest exact representation)");

    std::vector<std::string> coordinates;
    app.add_option("coordinates", coordinates, "o_x_km o_y_km o_z_km x_km y_km z_km");

    // CLI11 consumes arguments from the back of the vector
    std::vector<std::string> reversed;
    reversed.reserve(args.size());
    for (auto it = args.rbegin(); it != args.rend(); ++it) {
        reversed.push_back(normalizeNegative(*it));
    }
    try {
        app.parse(std::move(reversed));
    } catch (const CLI::ParseError &e) {
        return app.exit(e, out, err);
    }

    spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);

    try {
        parseCoordinates(coordinates, config);
    } catch (const UsageException &e) {
        debug("{}", e.what());
        out << USAGE << std::endl;
        return 1;
    } catch (const InputException &e) {
        err << e.what() << std::endl;
        return 1;
    }

    std::optional<int> precision;
    if (config.hasPrecision()) {
        precision = config.getPrecision();
    }

    Vec3 observer = config.getObserver();
    logObserver(observer);

    if (config.getInverse()) {
        Vec3 in = config.getTarget();
        SEZ sez{in.x, in.y, in.z};
        logLookAngles(sez);

        Vec3 ecef = sezToECEF(observer, sez);
        out << formatValue(ecef.x, precision) << std::endl;
        out << formatValue(ecef.y, precision) << std::endl;
        out << formatValue(ecef.z, precision) << std::endl;
        return 0;
    }

    Vec3 target = config.getTarget();
    Vec3 diff = target - observer;
    debug("ECEF delta: dx={} km, dy={} km, dz={} km", diff.x, diff.y, diff.z);

    SEZ sez = ecefToSEZ(observer, target);
    logLookAngles(sez);

    out << formatValue(sez.southInKilometers, precision) << std::endl;
    out << formatValue(sez.eastInKilometers, precision) << std::endl;
    out << formatValue(sez.zenithInKilometers, precision) << std::endl;
    return 0;
}

}
