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
#include "lsst/meas/aperture/RectangularAperture.h"

namespace lsst {
namespace meas {
namespace aperture {

namespace {

double checkSide(double value, char const* name) {
    if (!std::isfinite(value) || value < 0.0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Rectangle %s must be finite and >= 0 (got %g)") % name % value).str());
    }
    return value;
}

}  // namespace

RectangularAperture::RectangularAperture(geom::Point2D const& center, double w, double h,
                                         geom::Angle const& theta)
        : Aperture(center),
          _w(checkSide(w, "width")),
          _h(checkSide(h, "height")),
          _theta(theta),
          _rotation(geom::LinearTransform::makeRotation((-theta.asRadians()) * geom::radians)) {
    if (!std::isfinite(theta.asRadians())) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError, "Rectangle angle must be finite");
    }
}

double RectangularAperture::computeArea() const { return _w * _h; }

geom::Box2D RectangularAperture::computeBBox() const {
    double const c = std::cos(_theta.asRadians());
    double const s = std::sin(_theta.asRadians());
    double const dx = 0.5 * (std::fabs(_w * c) + std::fabs(_h * s));
    double const dy = 0.5 * (std::fabs(_w * s) + std::fabs(_h * c));
    geom::Point2D const& center = getCenter();
    return geom::Box2D(geom::Point2D(center.getX() - dx, center.getY() - dy),
                       geom::Point2D(center.getX() + dx, center.getY() + dy));
}

geom::Point2D RectangularAperture::toCanonical(geom::Point2D const& point) const {
    return geom::Point2D(_rotation(point - getCenter()));
}

bool RectangularAperture::contains(geom::Point2D const& point) const {
    geom::Point2D const p = toCanonical(point);
    return std::fabs(p.getX()) < 0.5 * _w && std::fabs(p.getY()) < 0.5 * _h;
}

double RectangularAperture::computeExactOverlap(geom::Box2D const& pixel) const {
    if (!(_w > 0.0 && _h > 0.0)) {
        return 0.0;
    }
    Polygon polygon = makePixelPolygon(pixel);
    for (auto& p : polygon) {
        p = toCanonical(p);
    }
    geom::Box2D const rectangle(geom::Point2D(-0.5 * _w, -0.5 * _h), geom::Point2D(0.5 * _w, 0.5 * _h));
    return computePolygonArea(clipPolygon(polygon, makePixelPolygon(rectangle)));
}

RectangularAnnulus::RectangularAnnulus(geom::Point2D const& center, double wIn, double hIn, double wOut,
                                       double hOut, geom::Angle const& theta)
        : AnnulusAperture<RectangularAperture>(RectangularAperture(center, wIn, hIn, theta),
                                               RectangularAperture(center, wOut, hOut, theta)) {
    if (!(wIn < wOut && hIn < hOut)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Inner rectangle (w=%g, h=%g) must lie within outer rectangle "
                                         "(w=%g, h=%g)") %
                           wIn % hIn % wOut % hOut)
                                  .str());
    }
}

RectangularAnnulus RectangularAnnulus::fromOuterShape(geom::Point2D const& center, double wIn, double wOut,
                                                      double hOut, geom::Angle const& theta) {
    double const hIn = (wOut > 0.0) ? hOut * wIn / wOut : 0.0;
    return RectangularAnnulus(center, wIn, hIn, wOut, hOut, theta);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
