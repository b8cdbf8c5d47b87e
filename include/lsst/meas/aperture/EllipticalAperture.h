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

#ifndef LSST_MEAS_APERTURE_EllipticalAperture_h_INCLUDED
#define LSST_MEAS_APERTURE_EllipticalAperture_h_INCLUDED

#include "lsst/geom/Angle.h"
#include "lsst/geom/AffineTransform.h"
#include "lsst/afw/geom/ellipses/Ellipse.h"
#include "lsst/afw/geom/ellipses/Axes.h"
#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/Annulus.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief An elliptical aperture with semi-axes a and b, with the a axis rotated by theta
 *         counter-clockwise from the x axis.
 *
 *  Inclusion and exact overlap are evaluated in the ellipse's grid frame, in which the ellipse is the
 *  unit circle and a pixel becomes a parallelogram; the circle overlap is then scaled back by the
 *  Jacobian a*b.  An ellipse with a zero axis encloses nothing.
 */
class EllipticalAperture final : public Aperture {
public:
    /// @throws pex::exceptions::InvalidParameterError if either axis is negative or not finite.
    EllipticalAperture(geom::Point2D const& center, double a, double b, geom::Angle const& theta);

    double getA() const { return _a; }

    double getB() const { return _b; }

    geom::Angle getTheta() const { return _theta; }

    /// Return the aperture boundary as an afw ellipse.
    afw::geom::ellipses::Ellipse const& getEllipse() const { return _ellipse; }

    double computeArea() const override;

    geom::Box2D computeBBox() const override;

    bool contains(geom::Point2D const& point) const override;

    double computeExactOverlap(geom::Box2D const& pixel) const override;

    /**
     *  @brief Map a point into the frame in which the aperture is the unit circle at the origin.
     *
     *  Only meaningful when both axes are positive.
     */
    geom::Point2D toCanonical(geom::Point2D const& point) const { return _gridTransform(point); }

private:
    bool isDegenerate() const { return !(_a > 0.0 && _b > 0.0); }

    double _a;
    double _b;
    geom::Angle _theta;
    afw::geom::ellipses::Ellipse _ellipse;
    geom::AffineTransform _gridTransform;
};

/**
 *  @brief An elliptical annulus: the region between two concentric ellipses with a common orientation.
 */
class EllipticalAnnulus final : public AnnulusAperture<EllipticalAperture> {
public:
    /// @throws pex::exceptions::InvalidParameterError unless 0 <= aIn < aOut and 0 <= bIn < bOut.
    EllipticalAnnulus(geom::Point2D const& center, double aIn, double bIn, double aOut, double bOut,
                      geom::Angle const& theta);

    /**
     *  @brief Construct an annulus whose inner ellipse has the same axis ratio as the outer one.
     *
     *  The inner minor axis is bOut*aIn/aOut.
     */
    static EllipticalAnnulus fromOuterShape(geom::Point2D const& center, double aIn, double aOut, double bOut,
                                            geom::Angle const& theta);

    geom::Angle getTheta() const { return getOuter().getTheta(); }
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_EllipticalAperture_h_INCLUDED
