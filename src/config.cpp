/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <ecefsez/config.hpp>

namespace ecefsez {

Vec3 Config::getObserver() {
    return observer;
}

void Config::setObserver(const Vec3 &o) {
    observer = o;
}

Vec3 Config::getTarget() {
    return target;
}

void Config::setTarget(const Vec3 &t) {
    target = t;
}

bool Config::hasPrecision() {
    return precision.has_value();
}

void Config::clearPrecision() {
    precision.reset();
}

int Config::getPrecision() {
    return precision.value_or(0);
}

void Config::setPrecision(const int digits) {
    if (digits >= 0 && digits <= MAX_PRECISION) {
        precision = digits;
    } else if (digits > MAX_PRECISION) {
        precision = MAX_PRECISION;
    } else {
        precision = 0;
    }
}

bool Config::getInverse() {
    return inverse;
}

void Config::setInverse(bool i) {
    inverse = i;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

}
