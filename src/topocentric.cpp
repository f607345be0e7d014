/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <ecefsez/topocentric.hpp>

#include <cmath>

namespace ecefsez {

// Rotation terms shared by the forward and inverse transforms
struct FrameTrig {
    double sinLat, cosLat, sinLon, cosLon;
};

static FrameTrig frameTrig(const Vec3 &observerECEF) {
    Geocentric geo = ecefToGeocentric(observerECEF);
    return {
        std::sin(geo.latInRadians),
        std::cos(geo.latInRadians),
        std::sin(geo.lonInRadians),
        std::cos(geo.lonInRadians)
    };
}

// Convert ECEF coordinates to geocentric latitude and longitude
Geocentric ecefToGeocentric(const Vec3 &ecef) {
    double p = std::sqrt(ecef.x * ecef.x + ecef.y * ecef.y);

    // atan2(±0, -0) is ±π, so pin the polar axis to longitude 0 explicitly
    double lon = 0.0;
    if (ecef.x != 0.0 || ecef.y != 0.0) {
        lon = std::atan2(ecef.y, ecef.x);
    }
    double lat = std::atan2(ecef.z, p);

    return {lat, lon};
}

bool isDegenerateObserver(const Vec3 &observerECEF) {
    return observerECEF.x == 0.0 && observerECEF.y == 0.0 && observerECEF.z == 0.0;
}

// Transform ECEF coordinates to the observer's SEZ frame
// See documentation in topocentric.hpp for the rotation matrix
SEZ ecefToSEZ(const Vec3 &observerECEF, const Vec3 &targetECEF) {
    Vec3 diff = targetECEF - observerECEF;
    FrameTrig t = frameTrig(observerECEF);

    double south  = -t.sinLat * t.cosLon * diff.x - t.sinLat * t.sinLon * diff.y + t.cosLat * diff.z;
    double east   = -t.sinLon * diff.x + t.cosLon * diff.y;
    double zenith =  t.cosLat * t.cosLon * diff.x + t.cosLat * t.sinLon * diff.y + t.sinLat * diff.z;

    return {south, east, zenith};
}

// Transform an SEZ displacement back to an ECEF position
Vec3 sezToECEF(const Vec3 &observerECEF, const SEZ &sez) {
    FrameTrig t = frameTrig(observerECEF);
    double s = sez.southInKilometers;
    double e = sez.eastInKilometers;
    double z = sez.zenithInKilometers;

    // The rotation is orthonormal, so its inverse is its transpose
    Vec3 diff{
        -t.sinLat * t.cosLon * s - t.sinLon * e + t.cosLat * t.cosLon * z,
        -t.sinLat * t.sinLon * s + t.cosLon * e + t.cosLat * t.sinLon * z,
         t.cosLat * s + t.sinLat * z
    };

    return observerECEF + diff;
}

}
