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

#ifndef LSST_MEAS_aperture_h_INCLUDED
#define LSST_MEAS_aperture_h_INCLUDED

#include "lsst/meas/aperture/constants.h"
#include "lsst/meas/aperture/Geometry.h"
#include "lsst/meas/aperture/OverlapMethod.h"
#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/Annulus.h"
#include "lsst/meas/aperture/CircularAperture.h"
#include "lsst/meas/aperture/EllipticalAperture.h"
#include "lsst/meas/aperture/RectangularAperture.h"
#include "lsst/meas/aperture/AperturePhotometry.h"
#include "lsst/meas/aperture/Background.h"

#endif  // !LSST_MEAS_aperture_h_INCLUDED
