/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ECEFSEZ_TOPOCENTRIC_HPP
#define __ECEFSEZ_TOPOCENTRIC_HPP

#include <cmath>
#include <numbers>

namespace ecefsez {

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Earth-Centered Earth-Fixed (ECEF) coordinates, in kilometers.
 */
struct Vec3 {
    double x, y, z;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        return {x / mag, y / mag, z / mag};
    }
};

/**
 * Geocentric latitude and longitude of a point.
 *
 * These angles come straight from the direction of the ECEF vector, so they
 * describe a spherical Earth. They are not WGS84 geodetic coordinates.
 */
struct Geocentric {
    double latInRadians;    ///< Geocentric latitude (-π/2 to +π/2, positive = North)
    double lonInRadians;    ///< Longitude (-π to +π, positive = East)

    double latInDegrees() const { return latInRadians * RADIANS_TO_DEGREES; }
    double lonInDegrees() const { return lonInRadians * RADIANS_TO_DEGREES; }
};

/**
 * A displacement in an observer's local South-East-Zenith frame, in kilometers.
 */
struct SEZ {
    double southInKilometers;
    double eastInKilometers;
    double zenithInKilometers;

    /**
     * Straight-line distance from the observer.
     */
    double range() const {
        return std::sqrt(southInKilometers * southInKilometers +
                         eastInKilometers * eastInKilometers +
                         zenithInKilometers * zenithInKilometers);
    }

    /**
     * Angle above the observer's local horizontal plane.
     * A zero-length displacement has an elevation of 0.
     */
    double elevationInRadians() const {
        double r = range();
        if (r == 0.0) {
            return 0.0;
        }
        return std::asin(zenithInKilometers / r);
    }
};

// ============================================================================
// Coordinate System Transformations
// ============================================================================

/**
 * Computes the geocentric latitude and longitude of an ECEF position.
 *
 * Longitude is atan2(y, x) and latitude is atan2(z, sqrt(x² + y²)).
 * On the polar axis (x = y = 0) the longitude is defined to be 0, whatever
 * the signs of the zeros. The ECEF origin yields latitude 0 and longitude 0,
 * which does not describe a real local frame (see isDegenerateObserver).
 */
Geocentric ecefToGeocentric(const Vec3 &ecef);

/**
 * Returns true when an observer position cannot define a local frame,
 * which is only the case at the ECEF origin.
 */
bool isDegenerateObserver(const Vec3 &observerECEF);

/**
 * Transforms a position from ECEF to the observer's SEZ (South-East-Zenith) frame.
 *
 * The observer's geocentric angles (φ, λ) orient the frame and the
 * displacement d = target - observer is rotated into it:
 *
 *   south  = -sin(φ)cos(λ)·dx - sin(φ)sin(λ)·dy + cos(φ)·dz
 *   east   = -sin(λ)·dx       + cos(λ)·dy
 *   zenith =  cos(φ)cos(λ)·dx + cos(φ)sin(λ)·dy + sin(φ)·dz
 *
 * Zenith points radially outward through the observer. The function is pure
 * and may be called concurrently.
 *
 * @param observerECEF Origin of the local frame (km)
 * @param targetECEF Position to transform (km)
 * @return Displacement of the target in the observer's SEZ frame (km)
 */
SEZ ecefToSEZ(const Vec3 &observerECEF, const Vec3 &targetECEF);

/**
 * Transforms a displacement in the observer's SEZ frame back to an ECEF position.
 *
 * This is the exact inverse of ecefToSEZ: the transposed rotation is applied
 * and the observer's position is added back.
 */
Vec3 sezToECEF(const Vec3 &observerECEF, const SEZ &sez);

}

#endif
