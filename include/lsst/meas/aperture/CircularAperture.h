// -*- lsst-c++ -*-
/*
 * LSST Data Management System
 * Copyright 2008-2018 AURA/LSST.
 *
 * This product includes software developed by the
 * LSST Project (http://www.lsst.org/).
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the LSST License Statement and
 * the GNU General Public License along with this program.  If not,
 * see <http://www.lsstcorp.org/LegalNotices/>.
 */

#ifndef LSST_MEAS_APERTURE_CircularAperture_h_INCLUDED
#define LSST_MEAS_APERTURE_CircularAperture_h_INCLUDED

#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/Annulus.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief A circular aperture of radius r.
 *
 *  A zero radius is allowed and encloses nothing.
 */
class CircularAperture final : public Aperture {
public:
    /// @throws pex::exceptions::InvalidParameterError if the radius is negative or not finite.
    CircularAperture(geom::Point2D const& center, double radius);

    double getRadius() const { return _radius; }

    double computeArea() const override;

    geom::Box2D computeBBox() const override;

    bool contains(geom::Point2D const& point) const override;

    double computeExactOverlap(geom::Box2D const& pixel) const override;

    /**
     *  @brief Map a point into the frame in which the aperture is the unit circle at the origin.
     *
     *  Only meaningful for a positive radius.
     */
    geom::Point2D toCanonical(geom::Point2D const& point) const;

private:
    double _radius;
};

/**
 *  @brief A circular annulus: the region between radii rIn (excluded) and rOut.
 */
class CircularAnnulus final : public AnnulusAperture<CircularAperture> {
public:
    /// @throws pex::exceptions::InvalidParameterError unless 0 <= rIn < rOut.
    CircularAnnulus(geom::Point2D const& center, double rIn, double rOut);

    double getInnerRadius() const { return getInner().getRadius(); }

    double getOuterRadius() const { return getOuter().getRadius(); }
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_CircularAperture_h_INCLUDED
