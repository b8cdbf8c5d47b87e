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

#include <cmath>

#include "boost/format.hpp"

#include "lsst/pex/exceptions.h"
#include "lsst/meas/aperture/Geometry.h"
#include "lsst/meas/aperture/EllipticalAperture.h"

namespace lsst {
namespace meas {
namespace aperture {

namespace {

double checkAxis(double value, char const* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Ellipse axis %s must be finite and >= 0 (got %g)") % name % value)
                                  .str());
    }
    return value;
}

}  // namespace

EllipticalAperture::EllipticalAperture(geom::Point2D const& center, double a, double b,
                                       geom::Angle const& theta)
        : Aperture(center),
          _a(checkAxis(a, "a")),
          _b(checkAxis(b, "b")),
          _theta(theta),
          _ellipse(afw::geom::ellipses::Axes(a, b, theta.asRadians()), center),
          _gridTransform() {
    if (!std::isfinite(theta.asRadians())) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError, "Ellipse angle must be finite");
    }
    if (!isDegenerate()) {
        _gridTransform = _ellipse.getGridTransform();
    }
}

double EllipticalAperture::computeArea() const { return geom::PI * _a * _b; }

geom::Box2D EllipticalAperture::computeBBox() const { return _ellipse.computeBBox(); }

bool EllipticalAperture::contains(geom::Point2D const& point) const {
    if (isDegenerate()) {
        return false;
    }
    geom::Point2D const p = toCanonical(point);
    return p.getX() * p.getX() + p.getY() * p.getY() < 1.0;
}

double EllipticalAperture::computeExactOverlap(geom::Box2D const& pixel) const {
    if (isDegenerate()) {
        return 0.0;
    }
    Polygon polygon = makePixelPolygon(pixel);
    for (auto& p : polygon) {
        p = toCanonical(p);
    }
    return computeCircleOverlap(polygon, 1.0) * _a * _b;
}

EllipticalAnnulus::EllipticalAnnulus(geom::Point2D const& center, double aIn, double bIn, double aOut,
                                     double bOut, geom::Angle const& theta)
        : AnnulusAperture<EllipticalAperture>(EllipticalAperture(center, aIn, bIn, theta),
                                              EllipticalAperture(center, aOut, bOut, theta)) {
    if (!(aIn < aOut && bIn < bOut)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Inner ellipse (a=%g, b=%g) must lie within outer ellipse "
                                         "(a=%g, b=%g)") %
                           aIn % bIn % aOut % bOut)
                                  .str());
    }
}

EllipticalAnnulus EllipticalAnnulus::fromOuterShape(geom::Point2D const& center, double aIn, double aOut,
                                                    double bOut, geom::Angle const& theta) {
    double const bIn = (aOut > 0.0) ? bOut * aIn / aOut : 0.0;
    return EllipticalAnnulus(center, aIn, bIn, aOut, bOut, theta);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
