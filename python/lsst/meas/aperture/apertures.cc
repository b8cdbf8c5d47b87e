/*
 * LSST Data Management System
 * Copyright 2008-2018  AURA/LSST.
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
 * see <https://www.lsstcorp.org/LegalNotices/>.
 */

#include "pybind11/pybind11.h"
#include "pybind11/stl.h"
#include "lsst/cpputils/python.h"

#include <memory>

#include "lsst/meas/aperture/OverlapMethod.h"
#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/CircularAperture.h"
#include "lsst/meas/aperture/EllipticalAperture.h"
#include "lsst/meas/aperture/RectangularAperture.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace aperture {
namespace {

using PyOverlapMethod = py::class_<OverlapMethod>;
using PyAperture = py::classh<Aperture>;

void declareOverlapMethod(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyOverlapMethod(wrappers.module, "OverlapMethod"), [](auto &mod, auto &cls) {
        py::enum_<OverlapMethod::Type>(cls, "Type")
                .value("CENTER", OverlapMethod::CENTER)
                .value("EXACT", OverlapMethod::EXACT)
                .value("SUBPIXEL", OverlapMethod::SUBPIXEL)
                .export_values();

        cls.def_static("center", &OverlapMethod::center);
        cls.def_static("exact", &OverlapMethod::exact);
        cls.def_static("subpixel", &OverlapMethod::subpixel, "subpixels"_a);
        cls.def_static("fromString", &OverlapMethod::fromString, "name"_a, "subpixels"_a = 5);
        cls.def("getType", &OverlapMethod::getType);
        cls.def("getSubpixels", &OverlapMethod::getSubpixels);
        cls.def("__eq__", &OverlapMethod::operator==, py::is_operator());
        cls.def("__ne__", &OverlapMethod::operator!=, py::is_operator());
        cls.def("__str__", &OverlapMethod::toString);
        cls.def("__repr__", [](OverlapMethod const &self) { return "OverlapMethod." + self.toString(); });
    });
}

void declareAperture(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyAperture(wrappers.module, "Aperture"), [](auto &mod, auto &cls) {
        // constructor not wrapped because class is abstract
        cls.def("getCenter", &Aperture::getCenter);
        cls.def("computeArea", &Aperture::computeArea);
        cls.def("computeBBox", &Aperture::computeBBox);
        cls.def("contains", &Aperture::contains, "point"_a);
        cls.def("computeExactOverlap", &Aperture::computeExactOverlap, "pixel"_a);
        cls.def("computeOverlap", &Aperture::computeOverlap, "pixel"_a, "method"_a);
        cls.def("computeCutout", &Aperture::computeCutout, "imageBBox"_a);
        cls.def("computeOverlapImage", &Aperture::computeOverlapImage, "bbox"_a, "method"_a);
    });
}

void declareCircular(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::classh<CircularAperture, Aperture>(wrappers.module, "CircularAperture"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double>(), "center"_a, "radius"_a);
                          cls.def("getRadius", &CircularAperture::getRadius);
                      });
    wrappers.wrapType(py::classh<CircularAnnulus, Aperture>(wrappers.module, "CircularAnnulus"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double, double>(), "center"_a, "rIn"_a,
                                  "rOut"_a);
                          cls.def("getInnerRadius", &CircularAnnulus::getInnerRadius);
                          cls.def("getOuterRadius", &CircularAnnulus::getOuterRadius);
                      });
}

void declareElliptical(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::classh<EllipticalAperture, Aperture>(wrappers.module, "EllipticalAperture"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double, double, geom::Angle const &>(),
                                  "center"_a, "a"_a, "b"_a, "theta"_a);
                          cls.def("getA", &EllipticalAperture::getA);
                          cls.def("getB", &EllipticalAperture::getB);
                          cls.def("getTheta", &EllipticalAperture::getTheta);
                          cls.def("getEllipse", &EllipticalAperture::getEllipse);
                      });
    wrappers.wrapType(py::classh<EllipticalAnnulus, Aperture>(wrappers.module, "EllipticalAnnulus"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double, double, double, double,
                                           geom::Angle const &>(),
                                  "center"_a, "aIn"_a, "bIn"_a, "aOut"_a, "bOut"_a, "theta"_a);
                          cls.def_static("fromOuterShape", &EllipticalAnnulus::fromOuterShape, "center"_a,
                                         "aIn"_a, "aOut"_a, "bOut"_a, "theta"_a);
                          cls.def("getInner", &EllipticalAnnulus::getInner);
                          cls.def("getOuter", &EllipticalAnnulus::getOuter);
                          cls.def("getTheta", &EllipticalAnnulus::getTheta);
                      });
}

void declareRectangular(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::classh<RectangularAperture, Aperture>(wrappers.module, "RectangularAperture"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double, double, geom::Angle const &>(),
                                  "center"_a, "w"_a, "h"_a, "theta"_a);
                          cls.def("getWidth", &RectangularAperture::getWidth);
                          cls.def("getHeight", &RectangularAperture::getHeight);
                          cls.def("getTheta", &RectangularAperture::getTheta);
                      });
    wrappers.wrapType(py::classh<RectangularAnnulus, Aperture>(wrappers.module, "RectangularAnnulus"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<geom::Point2D const &, double, double, double, double,
                                           geom::Angle const &>(),
                                  "center"_a, "wIn"_a, "hIn"_a, "wOut"_a, "hOut"_a, "theta"_a);
                          cls.def_static("fromOuterShape", &RectangularAnnulus::fromOuterShape, "center"_a,
                                         "wIn"_a, "wOut"_a, "hOut"_a, "theta"_a);
                          cls.def("getInner", &RectangularAnnulus::getInner);
                          cls.def("getOuter", &RectangularAnnulus::getOuter);
                          cls.def("getTheta", &RectangularAnnulus::getTheta);
                      });
}

}  // namespace

void wrapApertures(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareOverlapMethod(wrappers);
    declareAperture(wrappers);
    declareCircular(wrappers);
    declareElliptical(wrappers);
    declareRectangular(wrappers);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
