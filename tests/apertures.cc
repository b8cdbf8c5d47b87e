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
#include <limits>
#include <memory>
#include <vector>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE apertures

#include "boost/test/unit_test.hpp"
#include "boost/test/floating_point_comparison.hpp"

#include "lsst/pex/exceptions.h"
#include "lsst/geom/Angle.h"
#include "lsst/meas/aperture.h"

namespace aperture = lsst::meas::aperture;
namespace geom = lsst::geom;
namespace image = lsst::afw::image;
namespace pexExcept = lsst::pex::exceptions;

namespace {

geom::Box2D makePixel(int x, int y) {
    return geom::Box2D(geom::Point2D(x - 0.5, y - 0.5), geom::Point2D(x + 0.5, y + 0.5));
}

// One of each shape, all centered at the same point.
std::vector<std::shared_ptr<aperture::Aperture const>> makeShapes(geom::Point2D const& center) {
    std::vector<std::shared_ptr<aperture::Aperture const>> shapes;
    shapes.push_back(std::make_shared<aperture::CircularAperture>(center, 3.0));
    shapes.push_back(std::make_shared<aperture::CircularAnnulus>(center, 3.0, 5.0));
    shapes.push_back(std::make_shared<aperture::EllipticalAperture>(center, 5.0, 2.0, 0.7 * geom::radians));
    shapes.push_back(std::make_shared<aperture::EllipticalAnnulus>(
            aperture::EllipticalAnnulus::fromOuterShape(center, 3.0, 5.0, 4.0, 0.3 * geom::radians)));
    shapes.push_back(std::make_shared<aperture::RectangularAperture>(center, 5.0, 2.0, 0.7 * geom::radians));
    shapes.push_back(std::make_shared<aperture::RectangularAnnulus>(
            aperture::RectangularAnnulus::fromOuterShape(center, 3.0, 5.0, 4.0, 0.3 * geom::radians)));
    return shapes;
}

double sumImage(image::Image<aperture::OverlapElement> const& img) {
    double total = 0.0;
    for (int y = 0; y < img.getHeight(); ++y) {
        for (auto ptr = img.row_begin(y); ptr != img.row_end(y); ++ptr) {
            total += *ptr;
        }
    }
    return total;
}

}  // namespace

BOOST_AUTO_TEST_CASE(AnalyticAreas) {
    geom::Point2D const center(20.0, 20.0);
    BOOST_CHECK_CLOSE(aperture::CircularAperture(center, 3.0).computeArea(), 9.0 * geom::PI, 1E-12);
    BOOST_CHECK_CLOSE(aperture::CircularAnnulus(center, 3.0, 5.0).computeArea(), 16.0 * geom::PI, 1E-12);
    BOOST_CHECK_CLOSE(aperture::EllipticalAperture(center, 3.0, 2.0, 0.0 * geom::radians).computeArea(),
                      6.0 * geom::PI, 1E-12);
    BOOST_CHECK_CLOSE(aperture::EllipticalAnnulus(center, 3.0, 2.0, 5.0, 4.0, 0.0 * geom::radians)
                              .computeArea(),
                      14.0 * geom::PI, 1E-12);
    BOOST_CHECK_CLOSE(aperture::RectangularAperture(center, 3.0, 5.0, 0.0 * geom::radians).computeArea(), 15.0,
                      1E-12);
    BOOST_CHECK_CLOSE(aperture::RectangularAnnulus(center, 3.0, 2.0, 5.0, 4.0, 0.0 * geom::radians)
                              .computeArea(),
                      14.0, 1E-12);
}

BOOST_AUTO_TEST_CASE(FromOuterShape) {
    geom::Point2D const center(0.0, 0.0);
    aperture::EllipticalAnnulus ellipse =
            aperture::EllipticalAnnulus::fromOuterShape(center, 3.0, 5.0, 4.0, 0.0 * geom::radians);
    BOOST_CHECK_CLOSE(ellipse.getInner().getA(), 3.0, 1E-12);
    BOOST_CHECK_CLOSE(ellipse.getInner().getB(), 2.4, 1E-12);
    BOOST_CHECK_CLOSE(ellipse.getOuter().getB(), 4.0, 1E-12);

    aperture::RectangularAnnulus rect =
            aperture::RectangularAnnulus::fromOuterShape(center, 8.0, 10.0, 4.0, 0.0 * geom::radians);
    BOOST_CHECK_CLOSE(rect.getInner().getWidth(), 8.0, 1E-12);
    BOOST_CHECK_CLOSE(rect.getInner().getHeight(), 3.2, 1E-12);
    BOOST_CHECK_CLOSE(rect.computeArea(), 40.0 - 25.6, 1E-10);
}

BOOST_AUTO_TEST_CASE(BoundaryIsOutside) {
    geom::Point2D const center(10.0, 10.0);
    aperture::CircularAperture circle(center, 2.0);
    BOOST_CHECK(circle.contains(center));
    BOOST_CHECK(circle.contains(geom::Point2D(11.999, 10.0)));
    BOOST_CHECK(!circle.contains(geom::Point2D(12.0, 10.0)));
    BOOST_CHECK(!circle.contains(geom::Point2D(10.0, 8.0)));

    aperture::RectangularAperture rect(center, 4.0, 2.0, 0.0 * geom::radians);
    BOOST_CHECK(rect.contains(geom::Point2D(11.9, 10.9)));
    BOOST_CHECK(!rect.contains(geom::Point2D(12.0, 10.0)));
    BOOST_CHECK(!rect.contains(geom::Point2D(10.0, 11.0)));

    aperture::CircularAnnulus annulus(center, 1.0, 2.0);
    BOOST_CHECK(!annulus.contains(center));
    BOOST_CHECK(annulus.contains(geom::Point2D(11.5, 10.0)));
    BOOST_CHECK(annulus.contains(geom::Point2D(11.0, 10.0)));  // on the inner boundary: inside
    BOOST_CHECK(!annulus.contains(geom::Point2D(12.0, 10.0)));  // on the outer boundary: outside

    aperture::CircularAperture point(center, 0.0);
    BOOST_CHECK(!point.contains(center));
    BOOST_CHECK_EQUAL(point.computeExactOverlap(makePixel(10, 10)), 0.0);
}

BOOST_AUTO_TEST_CASE(RotatedShapes) {
    geom::Point2D const center(10.0, 10.0);
    aperture::EllipticalAperture ellipse(center, 4.0, 1.0, 90.0 * geom::degrees);
    BOOST_CHECK(ellipse.contains(geom::Point2D(10.0, 13.5)));
    BOOST_CHECK(!ellipse.contains(geom::Point2D(13.5, 10.0)));

    aperture::RectangularAperture rect(center, 4.0, 1.0, 90.0 * geom::degrees);
    BOOST_CHECK(rect.contains(geom::Point2D(10.0, 11.9)));
    BOOST_CHECK(!rect.contains(geom::Point2D(11.9, 10.0)));

    geom::Box2D const bbox = rect.computeBBox();
    BOOST_CHECK_CLOSE(bbox.getWidth(), 1.0, 1E-10);
    BOOST_CHECK_CLOSE(bbox.getHeight(), 4.0, 1E-10);
}

BOOST_AUTO_TEST_CASE(EqualAxesMatchCircle) {
    geom::Point2D const center(5.3, 4.1);
    aperture::CircularAperture circle(center, 3.7);
    aperture::EllipticalAperture ellipse(center, 3.7, 3.7, 0.6 * geom::radians);
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 11; ++x) {
            BOOST_CHECK_SMALL(circle.computeExactOverlap(makePixel(x, y)) -
                                      ellipse.computeExactOverlap(makePixel(x, y)),
                              1E-10);
        }
    }
}

BOOST_AUTO_TEST_CASE(QuarterRotationSwapsRectangle) {
    geom::Point2D const center(5.0, 5.0);
    aperture::RectangularAperture rotated(center, 6.0, 3.0, 90.0 * geom::degrees);
    aperture::RectangularAperture swapped(center, 3.0, 6.0, 0.0 * geom::radians);
    for (int y = 0; y < 11; ++y) {
        for (int x = 0; x < 11; ++x) {
            BOOST_CHECK_SMALL(rotated.computeExactOverlap(makePixel(x, y)) -
                                      swapped.computeExactOverlap(makePixel(x, y)),
                              1E-10);
        }
    }
}

BOOST_AUTO_TEST_CASE(DiamondInPixel) {
    aperture::RectangularAperture diamond(geom::Point2D(3.0, 4.0), 1.0, 1.0, 45.0 * geom::degrees);
    BOOST_CHECK_CLOSE(diamond.computeOverlap(makePixel(3, 4), aperture::OverlapMethod::exact()),
                      2.0 * (std::sqrt(2.0) - 1.0), 1E-10);
}

BOOST_AUTO_TEST_CASE(ExactOverlapSumsToArea) {
    geom::Box2I const bbox(geom::Point2I(0, 0), geom::Extent2I(40, 40));
    for (auto const& shape : makeShapes(geom::Point2D(20.3, 19.6))) {
        geom::Box2I const cutout = shape->computeCutout(bbox);
        auto weights = shape->computeOverlapImage(cutout, aperture::OverlapMethod::exact());
        BOOST_CHECK(weights->getBBox() == cutout);
        BOOST_CHECK_CLOSE(sumImage(*weights), shape->computeArea(), 1E-8);
    }
}

BOOST_AUTO_TEST_CASE(OverlapFractionsInRange) {
    geom::Box2I const bbox(geom::Point2I(0, 0), geom::Extent2I(40, 40));
    std::vector<aperture::OverlapMethod> const methods = {
            aperture::OverlapMethod::center(), aperture::OverlapMethod::exact(),
            aperture::OverlapMethod::subpixel(7)};
    for (auto const& shape : makeShapes(geom::Point2D(20.3, 19.6))) {
        for (auto const& method : methods) {
            auto weights = shape->computeOverlapImage(shape->computeCutout(bbox), method);
            for (int y = 0; y < weights->getHeight(); ++y) {
                for (auto ptr = weights->row_begin(y); ptr != weights->row_end(y); ++ptr) {
                    BOOST_CHECK(*ptr >= 0.0 && *ptr <= 1.0);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(SingleSubpixelIsCenter) {
    for (auto const& shape : makeShapes(geom::Point2D(10.5, 9.0))) {
        for (int y = 0; y < 20; ++y) {
            for (int x = 0; x < 20; ++x) {
                BOOST_CHECK_EQUAL(shape->computeOverlap(makePixel(x, y), aperture::OverlapMethod::subpixel(1)),
                                  shape->computeOverlap(makePixel(x, y), aperture::OverlapMethod::center()));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(Cutout) {
    geom::Box2I const bbox(geom::Point2I(0, 0), geom::Extent2I(20, 20));
    aperture::CircularAperture inside(geom::Point2D(10.0, 10.0), 3.0);
    geom::Box2I const cutout = inside.computeCutout(bbox);
    BOOST_CHECK(cutout.contains(geom::Box2I(geom::Point2I(7, 7), geom::Point2I(13, 13))));
    BOOST_CHECK(bbox.contains(cutout));

    aperture::CircularAperture corner(geom::Point2D(0.0, 0.0), 3.0);
    BOOST_CHECK_EQUAL(corner.computeCutout(bbox).getMinX(), 0);
    BOOST_CHECK_EQUAL(corner.computeCutout(bbox).getMinY(), 0);

    aperture::CircularAperture outside(geom::Point2D(-60.0, 60.0), 3.0);
    BOOST_CHECK(outside.computeCutout(bbox).isEmpty());
}

BOOST_AUTO_TEST_CASE(OverlapMethods) {
    BOOST_CHECK(aperture::OverlapMethod::fromString("center") == aperture::OverlapMethod::center());
    BOOST_CHECK(aperture::OverlapMethod::fromString("exact") == aperture::OverlapMethod::exact());
    BOOST_CHECK(aperture::OverlapMethod::fromString("subpixel", 10) == aperture::OverlapMethod::subpixel(10));
    BOOST_CHECK(aperture::OverlapMethod::subpixel(10) != aperture::OverlapMethod::subpixel(5));
    BOOST_CHECK_EQUAL(aperture::OverlapMethod::subpixel(10).getSubpixels(), 10);
    BOOST_CHECK_EQUAL(aperture::OverlapMethod::subpixel(10).toString(), "subpixel(10)");
    BOOST_CHECK_THROW(aperture::OverlapMethod::subpixel(0), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::OverlapMethod::fromString("subpixel", -1), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::OverlapMethod::fromString("gaussian"), pexExcept::InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(InvalidConstruction) {
    geom::Point2D const center(5.0, 5.0);
    double const nan = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_THROW(aperture::CircularAperture(center, -1.0), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::CircularAperture(geom::Point2D(nan, 5.0), 1.0),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::CircularAnnulus(center, 5.0, 3.0), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::CircularAnnulus(center, 3.0, 3.0), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::EllipticalAperture(center, -1.0, 2.0, 0.0 * geom::radians),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::EllipticalAperture(center, 1.0, 2.0, nan * geom::radians),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::EllipticalAnnulus(center, 3.0, 5.0, 5.0, 4.0, 0.0 * geom::radians),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::RectangularAperture(center, 1.0, -2.0, 0.0 * geom::radians),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(aperture::RectangularAnnulus(center, 6.0, 2.0, 5.0, 4.0, 0.0 * geom::radians),
                      pexExcept::InvalidParameterError);
}
