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

#include "lsst/geom/Angle.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/aperture/Geometry.h"
#include "lsst/meas/aperture/CircularAperture.h"

namespace lsst {
namespace meas {
namespace aperture {

CircularAperture::CircularAperture(geom::Point2D const& center, double radius)
        : Aperture(center), _radius(radius) {
    if (!std::isfinite(radius) || radius < 0.0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Radius must be finite and >= 0 (got %g)") % radius).str());
    }
}

double CircularAperture::computeArea() const { return geom::PI * _radius * _radius; }

geom::Box2D CircularAperture::computeBBox() const {
    geom::Point2D const& c = getCenter();
    return geom::Box2D(geom::Point2D(c.getX() - _radius, c.getY() - _radius),
                       geom::Point2D(c.getX() + _radius, c.getY() + _radius));
}

geom::Point2D CircularAperture::toCanonical(geom::Point2D const& point) const {
    return geom::Point2D((point.getX() - getCenter().getX()) / _radius,
                         (point.getY() - getCenter().getY()) / _radius);
}

bool CircularAperture::contains(geom::Point2D const& point) const {
    if (_radius <= 0.0) {
        return false;
    }
    geom::Point2D const p = toCanonical(point);
    return p.getX() * p.getX() + p.getY() * p.getY() < 1.0;
}

double CircularAperture::computeExactOverlap(geom::Box2D const& pixel) const {
    return computeCircleOverlap(pixel, getCenter(), _radius);
}

CircularAnnulus::CircularAnnulus(geom::Point2D const& center, double rIn, double rOut)
        : AnnulusAperture<CircularAperture>(CircularAperture(center, rIn), CircularAperture(center, rOut)) {
    if (!(rIn < rOut)) {
        throw LSST_EXCEPT(
                pex::exceptions::InvalidParameterError,
                (boost::format("Inner radius must be less than outer radius (rIn=%g, rOut=%g)") % rIn % rOut)
                        .str());
    }
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
