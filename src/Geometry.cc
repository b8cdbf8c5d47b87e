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

#include "lsst/meas/aperture/Geometry.h"

namespace lsst {
namespace meas {
namespace aperture {

namespace {

inline double cross(geom::Point2D const& a, geom::Point2D const& b) {
    return a.getX() * b.getY() - a.getY() * b.getX();
}

inline double dot(geom::Point2D const& a, geom::Point2D const& b) {
    return a.getX() * b.getX() + a.getY() * b.getY();
}

// Signed area of the circular sector of radius^2 == r2 spanned by the rays through a and b.
inline double computeSectorArea(geom::Point2D const& a, geom::Point2D const& b, double r2) {
    return 0.5 * r2 * std::atan2(cross(a, b), dot(a, b));
}

// Signed area of the intersection of triangle (origin, a, b) with the origin-centered circle.
double computeTriangleOverlap(geom::Point2D const& a, geom::Point2D const& b, double r2) {
    bool const aInside = dot(a, a) <= r2;
    bool const bInside = dot(b, b) <= r2;
    if (aInside && bInside) {
        return 0.5 * cross(a, b);
    }
    double const dx = b.getX() - a.getX();
    double const dy = b.getY() - a.getY();
    // Solve |a + t (b - a)|^2 == r2 for the crossings of the edge with the circle.
    double const qa = dx * dx + dy * dy;
    if (qa == 0.0) {
        return 0.0;
    }
    double const qb = a.getX() * dx + a.getY() * dy;
    double const qc = dot(a, a) - r2;
    double const disc = qb * qb - qa * qc;
    if (disc <= 0.0) {
        return computeSectorArea(a, b, r2);
    }
    double const s = std::sqrt(disc);
    double const t1 = (-qb - s) / qa;
    double const t2 = (-qb + s) / qa;
    geom::Point2D const p1(a.getX() + t1 * dx, a.getY() + t1 * dy);
    geom::Point2D const p2(a.getX() + t2 * dx, a.getY() + t2 * dy);
    if (aInside) {
        return 0.5 * cross(a, p2) + computeSectorArea(p2, b, r2);
    }
    if (bInside) {
        return computeSectorArea(a, p1, r2) + 0.5 * cross(p1, b);
    }
    if (t1 >= 1.0 || t2 <= 0.0) {
        // the line crosses the circle, but not between a and b
        return computeSectorArea(a, b, r2);
    }
    return computeSectorArea(a, p1, r2) + 0.5 * cross(p1, p2) + computeSectorArea(p2, b, r2);
}

double computeSignedArea(Polygon const& polygon) {
    double area = 0.0;
    std::size_t j = polygon.size() - 1;
    for (std::size_t i = 0; i < polygon.size(); ++i) {
        area += (polygon[j].getX() + polygon[i].getX()) * (polygon[j].getY() - polygon[i].getY());
        j = i;
    }
    return -0.5 * area;
}

}  // namespace

Polygon makePixelPolygon(geom::Box2D const& pixel) {
    Polygon polygon;
    polygon.reserve(4);
    polygon.emplace_back(pixel.getMinX(), pixel.getMinY());
    polygon.emplace_back(pixel.getMaxX(), pixel.getMinY());
    polygon.emplace_back(pixel.getMaxX(), pixel.getMaxY());
    polygon.emplace_back(pixel.getMinX(), pixel.getMaxY());
    return polygon;
}

double computePolygonArea(Polygon const& polygon) {
    if (polygon.size() < 3) {
        return 0.0;
    }
    return std::fabs(computeSignedArea(polygon));
}

Polygon clipPolygon(Polygon const& subject, Polygon const& convexClip) {
    if (subject.empty() || convexClip.size() < 3) {
        return Polygon();
    }
    // Orient the "inside" test so that it works for either winding of the clip polygon.
    double const orientation = (computeSignedArea(convexClip) < 0.0) ? -1.0 : 1.0;
    Polygon output = subject;
    geom::Point2D c1 = convexClip.back();
    for (auto const& c2 : convexClip) {
        Polygon input;
        input.swap(output);
        if (input.empty()) {
            break;
        }
        double const ex = c2.getX() - c1.getX();
        double const ey = c2.getY() - c1.getY();
        auto side = [&](geom::Point2D const& p) {
            return orientation * (ex * (p.getY() - c1.getY()) - ey * (p.getX() - c1.getX()));
        };
        geom::Point2D s = input.back();
        double sSide = side(s);
        for (auto const& e : input) {
            double const eSide = side(e);
            if (eSide >= 0.0) {
                if (sSide < 0.0) {
                    double const t = sSide / (sSide - eSide);
                    output.emplace_back(s.getX() + t * (e.getX() - s.getX()),
                                        s.getY() + t * (e.getY() - s.getY()));
                }
                output.push_back(e);
            } else if (sSide >= 0.0) {
                double const t = sSide / (sSide - eSide);
                output.emplace_back(s.getX() + t * (e.getX() - s.getX()), s.getY() + t * (e.getY() - s.getY()));
            }
            s = e;
            sSide = eSide;
        }
        c1 = c2;
    }
    return output;
}

double computeCircleOverlap(Polygon const& polygon, double radius) {
    if (!(radius > 0.0) || polygon.size() < 3) {
        return 0.0;
    }
    double const r2 = radius * radius;
    double area = 0.0;
    geom::Point2D a = polygon.back();
    for (auto const& b : polygon) {
        area += computeTriangleOverlap(a, b, r2);
        a = b;
    }
    return std::fabs(area);
}

double computeCircleOverlap(geom::Box2D const& box, geom::Point2D const& center, double radius) {
    Polygon polygon = makePixelPolygon(box);
    for (auto& p : polygon) {
        p = geom::Point2D(p.getX() - center.getX(), p.getY() - center.getY());
    }
    return computeCircleOverlap(polygon, radius);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
