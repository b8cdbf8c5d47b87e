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

#ifndef LSST_MEAS_APERTURE_RectangularAperture_h_INCLUDED
#define LSST_MEAS_APERTURE_RectangularAperture_h_INCLUDED

#include "lsst/geom/Angle.h"
#include "lsst/geom/LinearTransform.h"
#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/Annulus.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief A rectangular aperture of full width w and full height h, rotated by theta
 *         counter-clockwise about its center.
 *
 *  Points are rotated into the rectangle's own axes, where inclusion is a pair of bound checks; the
 *  exact overlap clips the rotated pixel square against the rectangle.  A rectangle with zero width
 *  or height encloses nothing.
 */
class RectangularAperture final : public Aperture {
public:
    /// @throws pex::exceptions::InvalidParameterError if w or h is negative or not finite.
    RectangularAperture(geom::Point2D const& center, double w, double h, geom::Angle const& theta);

    double getWidth() const { return _w; }

    double getHeight() const { return _h; }

    geom::Angle getTheta() const { return _theta; }

    double computeArea() const override;

    geom::Box2D computeBBox() const override;

    bool contains(geom::Point2D const& point) const override;

    double computeExactOverlap(geom::Box2D const& pixel) const override;

    /// Map a point into the rectangle frame: centered on the origin, with w along x and h along y.
    geom::Point2D toCanonical(geom::Point2D const& point) const;

private:
    double _w;
    double _h;
    geom::Angle _theta;
    geom::LinearTransform _rotation;
};

/**
 *  @brief A rectangular annulus: the region between two concentric rectangles with a common orientation.
 */
class RectangularAnnulus final : public AnnulusAperture<RectangularAperture> {
public:
    /// @throws pex::exceptions::InvalidParameterError unless 0 <= wIn < wOut and 0 <= hIn < hOut.
    RectangularAnnulus(geom::Point2D const& center, double wIn, double hIn, double wOut, double hOut,
                       geom::Angle const& theta);

    /**
     *  @brief Construct an annulus whose inner rectangle has the same aspect ratio as the outer one.
     *
     *  The inner height is hOut*wIn/wOut.
     */
    static RectangularAnnulus fromOuterShape(geom::Point2D const& center, double wIn, double wOut,
                                             double hOut, geom::Angle const& theta);

    geom::Angle getTheta() const { return getOuter().getTheta(); }
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_RectangularAperture_h_INCLUDED
