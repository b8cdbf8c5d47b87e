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

#include <algorithm>
#include <cmath>

#include "boost/format.hpp"

#include "lsst/pex/exceptions.h"
#include "lsst/meas/aperture/Aperture.h"

namespace lsst {
namespace meas {
namespace aperture {

Aperture::Aperture(geom::Point2D const& center) : _center(center) {
    if (!std::isfinite(center.getX()) || !std::isfinite(center.getY())) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Aperture center must be finite (got %g, %g)") % center.getX() %
                           center.getY())
                                  .str());
    }
}

double Aperture::computeOverlap(geom::Box2D const& pixel, OverlapMethod const& method) const {
    switch (method.getType()) {
        case OverlapMethod::CENTER:
            return contains(pixel.getCenter()) ? 1.0 : 0.0;
        case OverlapMethod::EXACT: {
            double const fraction = computeExactOverlap(pixel) / pixel.getArea();
            return std::min(1.0, std::max(0.0, fraction));
        }
        case OverlapMethod::SUBPIXEL:
            break;
    }
    int const n = method.getSubpixels();
    double const dx = pixel.getWidth() / n;
    double const dy = pixel.getHeight() / n;
    int count = 0;
    for (int j = 0; j < n; ++j) {
        double const y = pixel.getMinY() + (j + 0.5) * dy;
        for (int i = 0; i < n; ++i) {
            if (contains(geom::Point2D(pixel.getMinX() + (i + 0.5) * dx, y))) {
                ++count;
            }
        }
    }
    return static_cast<double>(count) / (n * n);
}

geom::Box2I Aperture::computeCutout(geom::Box2I const& imageBBox) const {
    // Clip in floating point first: the unclipped box of a distant or very large aperture need not fit
    // in integer pixel coordinates.
    geom::Box2D bbox = computeBBox();
    bbox.clip(geom::Box2D(imageBBox));
    if (bbox.isEmpty()) {
        return geom::Box2I();
    }
    geom::Box2I cutout(bbox, geom::Box2I::EXPAND);
    cutout.clip(imageBBox);
    return cutout;
}

std::shared_ptr<afw::image::Image<OverlapElement>> Aperture::computeOverlapImage(
        geom::Box2I const& bbox, OverlapMethod const& method) const {
    auto weights = std::make_shared<afw::image::Image<OverlapElement>>(bbox, 0.0);
    for (int iY = 0; iY < weights->getHeight(); ++iY) {
        double const y = bbox.getMinY() + iY;
        int iX = bbox.getMinX();
        auto const end = weights->row_end(iY);
        for (auto ptr = weights->row_begin(iY); ptr != end; ++ptr, ++iX) {
            geom::Box2D const pixel(geom::Point2D(iX - 0.5, y - 0.5), geom::Point2D(iX + 0.5, y + 0.5));
            *ptr = computeOverlap(pixel, method);
        }
    }
    return weights;
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
