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

#include "lsst/pex/config/python.h"

#include "lsst/meas/aperture/AperturePhotometry.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace aperture {
namespace {

using PyControl = py::class_<PhotometryControl>;
using PyResult = py::class_<PhotometryResult>;
using PyResultKey = py::class_<PhotometryResultKey>;
using PyPhotometry = py::class_<AperturePhotometry>;

void declareControl(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyControl(wrappers.module, "PhotometryControl"), [](auto &mod, auto &cls) {
        LSST_DECLARE_CONTROL_FIELD(cls, PhotometryControl, method);
        LSST_DECLARE_CONTROL_FIELD(cls, PhotometryControl, subpixels);
        LSST_DECLARE_CONTROL_FIELD(cls, PhotometryControl, errorWeighting);

        cls.def(py::init<>());
    });
}

void declareResult(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyResult(wrappers.module, "PhotometryResult"), [](auto &mod, auto &cls) {
        cls.def(py::init<>());
        cls.def_readwrite("xcenter", &PhotometryResult::xcenter);
        cls.def_readwrite("ycenter", &PhotometryResult::ycenter);
        cls.def_readwrite("apertureSum", &PhotometryResult::apertureSum);
        cls.def_readwrite("apertureSumErr", &PhotometryResult::apertureSumErr);
        cls.def_readwrite("truncated", &PhotometryResult::truncated);
    });
}

void declareResultKey(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyResultKey(wrappers.module, "PhotometryResultKey"), [](auto &mod, auto &cls) {
        cls.def(py::init<>());
        cls.def(py::init<afw::table::Schema const &>(), "schema"_a);
        cls.def_static("addFields", &PhotometryResultKey::addFields, "schema"_a, "withErrors"_a);
        cls.def("get", &PhotometryResultKey::get, "record"_a);
        cls.def("set", &PhotometryResultKey::set, "record"_a, "value"_a);
        cls.def("isValid", &PhotometryResultKey::isValid);
        cls.def("hasErrors", &PhotometryResultKey::hasErrors);
        cls.def("getXCenter", &PhotometryResultKey::getXCenter);
        cls.def("getYCenter", &PhotometryResultKey::getYCenter);
        cls.def("getApertureSum", &PhotometryResultKey::getApertureSum);
        cls.def("getApertureSumErr", &PhotometryResultKey::getApertureSumErr);
        cls.def("getTruncated", &PhotometryResultKey::getTruncated);
    });
}

template <typename T, class PyClass>
void declareComputeSums(PyClass &cls) {
    using Result = AperturePhotometry::Result;
    using Weighting = AperturePhotometry::ErrorWeighting;
    cls.def_static("computeSum",
                   (Result(*)(Aperture const &, afw::image::Image<T> const &, OverlapMethod const &)) &
                           AperturePhotometry::computeSum,
                   "aperture"_a, "image"_a, "method"_a);
    cls.def_static("computeSum",
                   (Result(*)(Aperture const &, afw::image::Image<T> const &, afw::image::Image<T> const &,
                              OverlapMethod const &, Weighting)) &
                           AperturePhotometry::computeSum,
                   "aperture"_a, "image"_a, "error"_a, "method"_a,
                   "weighting"_a = AperturePhotometry::FRACTION_SQUARED);
    cls.def_static("computeSum",
                   (Result(*)(Aperture const &, afw::image::MaskedImage<T> const &, OverlapMethod const &,
                              Weighting)) &
                           AperturePhotometry::computeSum,
                   "aperture"_a, "image"_a, "method"_a, "weighting"_a = AperturePhotometry::FRACTION_SQUARED);
}

template <typename T, class PyClass>
void declareRun(PyClass &cls) {
    using Catalog = afw::table::BaseCatalog;
    cls.def("run",
            (Catalog(AperturePhotometry::*)(ApertureVector const &, afw::image::Image<T> const &) const) &
                    AperturePhotometry::run,
            "apertures"_a, "image"_a);
    cls.def("run",
            (Catalog(AperturePhotometry::*)(ApertureVector const &, afw::image::Image<T> const &,
                                            afw::image::Image<T> const &) const) &
                    AperturePhotometry::run,
            "apertures"_a, "image"_a, "error"_a);
    cls.def("run",
            (Catalog(AperturePhotometry::*)(ApertureVector const &, afw::image::MaskedImage<T> const &)
                     const) &
                    AperturePhotometry::run,
            "apertures"_a, "image"_a);
    cls.def("run",
            (Catalog(AperturePhotometry::*)(Aperture const &, afw::image::Image<T> const &) const) &
                    AperturePhotometry::run,
            "aperture"_a, "image"_a);
    cls.def("run",
            (Catalog(AperturePhotometry::*)(Aperture const &, afw::image::Image<T> const &,
                                            afw::image::Image<T> const &) const) &
                    AperturePhotometry::run,
            "aperture"_a, "image"_a, "error"_a);
    cls.def("run",
            (Catalog(AperturePhotometry::*)(Aperture const &, afw::image::MaskedImage<T> const &) const) &
                    AperturePhotometry::run,
            "aperture"_a, "image"_a);
}

void declarePhotometry(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyPhotometry(wrappers.module, "AperturePhotometry"), [](auto &mod, auto &cls) {
        py::enum_<AperturePhotometry::ErrorWeighting>(cls, "ErrorWeighting")
                .value("FRACTION_SQUARED", AperturePhotometry::FRACTION_SQUARED)
                .value("FRACTION", AperturePhotometry::FRACTION)
                .export_values();

        cls.def(py::init<PhotometryControl const &>(), "ctrl"_a = PhotometryControl());
        cls.def_static("stringToErrorWeighting", &AperturePhotometry::stringToErrorWeighting, "name"_a);
        cls.def("getControl", &AperturePhotometry::getControl);
        cls.def("getMethod", &AperturePhotometry::getMethod);
        cls.def("getErrorWeighting", &AperturePhotometry::getErrorWeighting);
        cls.def("getSchema", &AperturePhotometry::getSchema, "withErrors"_a);

        declareComputeSums<float>(cls);
        declareComputeSums<double>(cls);
        declareRun<float>(cls);
        declareRun<double>(cls);
    });
}

}  // namespace

void wrapPhotometry(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareControl(wrappers);
    declareResult(wrappers);
    declareResultKey(wrappers);
    declarePhotometry(wrappers);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
