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

#ifndef LSST_MEAS_APERTURE_constants_h_INCLUDED
#define LSST_MEAS_APERTURE_constants_h_INCLUDED

#include <memory>
#include <vector>

#include "lsst/geom/Point.h"

namespace lsst {
namespace meas {
namespace aperture {

//@{ Typedefs that define the C++ types we typically use for photometry results
typedef double Flux;
typedef double FluxErrElement;
typedef double CentroidElement;
typedef double OverlapElement;
typedef geom::Point<CentroidElement, 2> Centroid;
//@}

class Aperture;

/// An ordered collection of independent apertures; each yields one output record.
typedef std::vector<std::shared_ptr<Aperture const>> ApertureVector;

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_constants_h_INCLUDED
