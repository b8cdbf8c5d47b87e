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

#ifndef LSST_MEAS_APERTURE_Aperture_h_INCLUDED
#define LSST_MEAS_APERTURE_Aperture_h_INCLUDED

#include <memory>

#include "lsst/geom/Point.h"
#include "lsst/geom/Box.h"
#include "lsst/afw/image/Image.h"
#include "lsst/meas/aperture/constants.h"
#include "lsst/meas/aperture/OverlapMethod.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief Abstract base class for a fixed geometric region used to sum pixel flux.
 *
 *  Apertures are immutable values positioned in continuous parent-pixel coordinates, in which pixel
 *  (i, j) is centered on (i, j) and covers [i-0.5, i+0.5] x [j-0.5, j+0.5].  Subclasses provide
 *  point inclusion, exact pixel overlap and extent; the overlap strategies and the cutout logic are
 *  implemented once, here.
 *
 *  Points lying exactly on a boundary are considered outside the aperture.  Boundaries have no
 *  area, so this agrees with the exact overlap, and the subpixel method converges to it.
 */
class Aperture {
public:
    Aperture(Aperture const&) = default;
    Aperture(Aperture&&) = default;
    Aperture& operator=(Aperture const&) = delete;
    Aperture& operator=(Aperture&&) = delete;

    virtual ~Aperture() = default;

    /// Return the position of the aperture center.
    geom::Point2D const& getCenter() const { return _center; }

    /// Return the analytic area enclosed by the aperture, in pixels.
    virtual double computeArea() const = 0;

    /// Return a floating-point box that encloses the whole aperture.
    virtual geom::Box2D computeBBox() const = 0;

    /// Return true if the point lies strictly inside the aperture.
    virtual bool contains(geom::Point2D const& point) const = 0;

    /**
     *  @brief Return the exact area of intersection between the aperture and an axis-aligned box.
     *
     *  This is an area, not a fraction; for a unit pixel the two are the same.
     */
    virtual double computeExactOverlap(geom::Box2D const& pixel) const = 0;

    /**
     *  @brief Return the fraction in [0, 1] of a pixel's area that lies inside the aperture.
     *
     *  @param[in]  pixel   Floating-point box covered by the pixel.
     *  @param[in]  method  Overlap strategy to use.
     */
    double computeOverlap(geom::Box2D const& pixel, OverlapMethod const& method) const;

    /**
     *  @brief Return the smallest pixel box, clipped to the image, that can overlap the aperture.
     *
     *  The result is empty if the aperture lies entirely outside imageBBox.
     */
    geom::Box2I computeCutout(geom::Box2I const& imageBBox) const;

    /**
     *  @brief Return an image of overlap fractions covering the given pixel box.
     *
     *  Pixels in bbox but outside the aperture are set to zero.
     */
    std::shared_ptr<afw::image::Image<OverlapElement>> computeOverlapImage(geom::Box2I const& bbox,
                                                                         OverlapMethod const& method) const;

protected:
    /// @throws pex::exceptions::InvalidParameterError if the center is not finite.
    explicit Aperture(geom::Point2D const& center);

private:
    geom::Point2D _center;
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_Aperture_h_INCLUDED
