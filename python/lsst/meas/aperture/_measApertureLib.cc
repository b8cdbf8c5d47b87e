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

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace aperture {

using cpputils::python::WrapperCollection;

void wrapApertures(WrapperCollection&);
void wrapPhotometry(WrapperCollection&);
void wrapBackground(WrapperCollection&);

PYBIND11_MODULE(_measApertureLib, mod) {
    lsst::cpputils::python::WrapperCollection wrappers(mod, "lsst.meas.aperture");

    wrappers.addInheritanceDependency("lsst.afw.image");
    wrappers.addInheritanceDependency("lsst.afw.table");
    wrappers.addInheritanceDependency("lsst.pex.exceptions");

    wrappers.addSignatureDependency("lsst.geom");
    wrappers.addSignatureDependency("lsst.afw.geom");

    wrapApertures(wrappers);
    wrapPhotometry(wrappers);
    wrapBackground(wrappers);
    wrappers.finish();
}
}  // namespace aperture
}  // namespace meas
}  // namespace lsst
