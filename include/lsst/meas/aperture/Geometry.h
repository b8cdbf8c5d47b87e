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

#ifndef LSST_MEAS_APERTURE_Geometry_h_INCLUDED
#define LSST_MEAS_APERTURE_Geometry_h_INCLUDED

#include <vector>

#include "lsst/geom/Point.h"
#include "lsst/geom/Box.h"

namespace lsst {
namespace meas {
namespace aperture {

/// A closed polygon, stored as its vertices in order (the last vertex connects to the first).
typedef std::vector<geom::Point2D> Polygon;

/**
 *  @brief Return the four corners of a box as a counter-clockwise polygon.
 */
Polygon makePixelPolygon(geom::Box2D const& pixel);

/**
 *  @brief Compute the (unsigned) area of a simple polygon with the shoelace formula.
 *
 *  Polygons with fewer than three vertices have zero area.
 */
double computePolygonArea(Polygon const& polygon);

/**
 *  @brief Clip a polygon against a convex polygon (Sutherland-Hodgman).
 *
 *  @param[in]  subject     Polygon to clip; need not be convex.
 *  @param[in]  convexClip  Convex clipping polygon, in either orientation.
 *
 *  The result is empty when the polygons do not overlap.  Degenerate (zero-area) clip polygons
 *  produce an empty or zero-area result.
 */
Polygon clipPolygon(Polygon const& subject, Polygon const& convexClip);

/**
 *  @brief Compute the exact area of intersection between a polygon and a circle centered on the origin.
 *
 *  The polygon is decomposed into the triangles (origin, p[i], p[i+1]); the signed intersection of
 *  the circle with each triangle is split at the points where the edge crosses the circle into
 *  straight triangular pieces (inside the circle) and circular sectors (outside it).  Summing the
 *  signed pieces handles every configuration uniformly: the circle entirely inside the polygon, the
 *  polygon entirely inside the circle, and edges with zero, one or two crossings.
 *
 *  @param[in]  polygon  Simple polygon, in either orientation.
 *  @param[in]  radius   Circle radius; a non-positive radius gives zero.
 */
double computeCircleOverlap(Polygon const& polygon, double radius);

/**
 *  @brief Compute the exact area of intersection between an axis-aligned box and a circle.
 */
double computeCircleOverlap(geom::Box2D const& box, geom::Point2D const& center, double radius);

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_Geometry_h_INCLUDED
