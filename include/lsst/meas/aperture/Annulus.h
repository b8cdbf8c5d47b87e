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

#ifndef LSST_MEAS_APERTURE_Annulus_h_INCLUDED
#define LSST_MEAS_APERTURE_Annulus_h_INCLUDED

#include <algorithm>

#include "lsst/meas/aperture/Aperture.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief Implementation shared by the annular apertures: the region inside an outer boundary and
 *         outside a concentric inner boundary of the same shape.
 *
 *  A point is inside if it is inside the outer boundary and not inside the inner one.  Since a point
 *  on a solid boundary is outside that boundary, a point on the outer boundary is outside the annulus
 *  and a point on the inner boundary is inside it.
 *
 *  BoundaryT must be one of the solid aperture classes.  Concrete annuli check that the inner boundary
 *  lies strictly within the outer one before they finish construction.
 */
template <typename BoundaryT>
class AnnulusAperture : public Aperture {
public:
    /// Return the inner boundary; its interior is excluded from the aperture.
    BoundaryT const& getInner() const { return _inner; }

    /// Return the outer boundary.
    BoundaryT const& getOuter() const { return _outer; }

    double computeArea() const override { return _outer.computeArea() - _inner.computeArea(); }

    geom::Box2D computeBBox() const override { return _outer.computeBBox(); }

    bool contains(geom::Point2D const& point) const override {
        return _outer.contains(point) && !_inner.contains(point);
    }

    // Clamped at zero to absorb round-off when both boundaries cover the pixel.
    double computeExactOverlap(geom::Box2D const& pixel) const override {
        return std::max(0.0, _outer.computeExactOverlap(pixel) - _inner.computeExactOverlap(pixel));
    }

protected:
    AnnulusAperture(BoundaryT const& inner, BoundaryT const& outer)
            : Aperture(outer.getCenter()), _inner(inner), _outer(outer) {}

private:
    BoundaryT _inner;
    BoundaryT _outer;
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_Annulus_h_INCLUDED
