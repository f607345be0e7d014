/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ECEFSEZ_CONFIG_HPP
#define __ECEFSEZ_CONFIG_HPP

#include <optional>
#include <ecefsez/topocentric.hpp>

namespace ecefsez {

// Largest number of decimals that still carries information for a double
constexpr int MAX_PRECISION = 17;

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    Vec3 getObserver();
    void setObserver(const Vec3 &o);

    // In inverse mode the target holds south, east and zenith instead of x, y and z
    Vec3 getTarget();
    void setTarget(const Vec3 &t);

    bool hasPrecision();
    void clearPrecision();
    int getPrecision();
    void setPrecision(const int digits);

    bool getInverse();
    void setInverse(bool);

    bool getVerbose();
    void setVerbose(bool);

private:
    Vec3 observer{0.0, 0.0, 0.0};
    Vec3 target{0.0, 0.0, 0.0};
    std::optional<int> precision;
    bool inverse = false;
    bool verbose = false;
};

}

#endif
