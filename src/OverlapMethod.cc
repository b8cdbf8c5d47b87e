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

#include "boost/format.hpp"

#include "lsst/pex/exceptions.h"
#include "lsst/meas/aperture/OverlapMethod.h"

namespace lsst {
namespace meas {
namespace aperture {

OverlapMethod OverlapMethod::subpixel(int subpixels) {
    if (subpixels < 1) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Number of subpixels must be >= 1 (got %d)") % subpixels).str());
    }
    return OverlapMethod(SUBPIXEL, subpixels);
}

OverlapMethod OverlapMethod::fromString(std::string const& name, int subpixels) {
    if (name == "center") {
        return center();
    } else if (name == "exact") {
        return exact();
    } else if (name == "subpixel") {
        return subpixel(subpixels);
    }
    throw LSST_EXCEPT(
            pex::exceptions::InvalidParameterError,
            (boost::format("Unrecognized overlap method '%s'; expected center, exact or subpixel") % name)
                    .str());
}

std::string OverlapMethod::toString() const {
    switch (_type) {
        case CENTER:
            return "center";
        case EXACT:
            return "exact";
        case SUBPIXEL:
            return (boost::format("subpixel(%d)") % _subpixels).str();
    }
    return "unknown";
}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
