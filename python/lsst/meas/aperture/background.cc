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
#include "lsst/cpputils/python.h"

#include "ndarray/pybind11.h"

#include "lsst/pex/config/python.h"
#include "lsst/meas/aperture/Background.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace aperture {
namespace {

using PySigmaClipControl = py::class_<SigmaClipControl>;

template <typename T>
void declareBackgroundFunctions(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrap([](auto &mod) {
        mod.def("estimateBackground",
                (double (*)(BackgroundEstimator, afw::image::Image<T> const &)) & estimateBackground,
                "estimator"_a, "image"_a);
        mod.def("estimateBackground",
                (ndarray::Array<double, 1, 1>(*)(BackgroundEstimator, afw::image::Image<T> const &, int)) &
                        estimateBackground,
                "estimator"_a, "image"_a, "dim"_a);
        mod.def("estimateBackground",
                (std::shared_ptr<afw::image::Image<double>>(*)(BackgroundEstimator,
                                                               afw::image::Image<T> const &,
                                                               geom::Extent2I const &, geom::Extent2I const &)) &
                        estimateBackground,
                "estimator"_a, "image"_a, "boxSize"_a, "filterSize"_a);
        mod.def("sigmaClipInPlace", &sigmaClipInPlace<T>, "image"_a, "ctrl"_a = SigmaClipControl());
        mod.def("sigmaClip", &sigmaClip<T>, "image"_a, "ctrl"_a = SigmaClipControl());
    });
}

}  // namespace

void wrapBackground(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::enum_<BackgroundEstimator>(wrappers.module, "BackgroundEstimator"),
                      [](auto &mod, auto &enm) {
                          enm.value("MEAN", MEAN);
                          enm.value("MEDIAN", MEDIAN);
                          enm.value("MODE", MODE);
                          enm.export_values();
                      });
    wrappers.wrapType(PySigmaClipControl(wrappers.module, "SigmaClipControl"), [](auto &mod, auto &cls) {
        LSST_DECLARE_CONTROL_FIELD(cls, SigmaClipControl, sigmaLow);
        LSST_DECLARE_CONTROL_FIELD(cls, SigmaClipControl, sigmaHigh);
        LSST_DECLARE_CONTROL_FIELD(cls, SigmaClipControl, center);
        LSST_DECLARE_CONTROL_FIELD(cls, SigmaClipControl, spread);

        cls.def(py::init<>());
    });
    wrappers.wrap([](auto &mod) {
        mod.def("stringToBackgroundEstimator", &stringToBackgroundEstimator, "name"_a);
    });
    declareBackgroundFunctions<float>(wrappers);
    declareBackgroundFunctions<double>(wrappers);
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
