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

#ifndef LSST_MEAS_APERTURE_Background_h_INCLUDED
#define LSST_MEAS_APERTURE_Background_h_INCLUDED

#include <memory>
#include <string>

#include "ndarray.h"

#include "lsst/pex/config.h"
#include "lsst/geom/Extent.h"
#include "lsst/afw/image/Image.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  Estimators for the level of a background region.
 */
enum BackgroundEstimator {
    MEAN = 0,  ///< arithmetic mean
    MEDIAN,    ///< median
    MODE       ///< Pearson mode estimate, 3*median - 2*mean
};

/// @throws pex::exceptions::InvalidParameterError for a name other than "MEAN", "MEDIAN" or "MODE".
BackgroundEstimator stringToBackgroundEstimator(std::string const& name);

/// Estimate the background level of all pixels in an image.
template <typename T>
double estimateBackground(BackgroundEstimator estimator, afw::image::Image<T> const& image);

/**
 *  @brief Estimate the background level along one image axis.
 *
 *  @param[in] estimator  Estimator to apply.
 *  @param[in] image      Image to reduce.
 *  @param[in] dim        Axis to reduce over: 0 reduces along y and returns one value per column,
 *                        1 reduces along x and returns one value per row.
 *
 *  @throws pex::exceptions::InvalidParameterError if dim is not 0 or 1.
 */
template <typename T>
ndarray::Array<double, 1, 1> estimateBackground(BackgroundEstimator estimator,
                                                afw::image::Image<T> const& image, int dim);

/**
 *  @brief Estimate a smoothly varying background over a grid of meshes.
 *
 *  The image is divided into meshes of boxSize pixels (the last row and column of meshes may be
 *  smaller), the estimator is evaluated in each mesh, and the grid of mesh values is median-filtered
 *  with a window of filterSize meshes.  The returned image has the bounding box of the input and is
 *  bilinearly interpolated between mesh centers, holding the nearest value beyond the outermost
 *  centers.
 *
 *  @throws pex::exceptions::InvalidParameterError if boxSize is not positive, or if filterSize is not
 *          positive and odd.
 */
template <typename T>
std::shared_ptr<afw::image::Image<double>> estimateBackground(BackgroundEstimator estimator,
                                                              afw::image::Image<T> const& image,
                                                              geom::Extent2I const& boxSize,
                                                              geom::Extent2I const& filterSize);

/**
 *  Configuration for sigmaClip
 */
class SigmaClipControl {
public:
    LSST_CONTROL_FIELD(sigmaLow, double, "Number of spreads below the center at which values are clipped");
    LSST_CONTROL_FIELD(sigmaHigh, double,
                       "Number of spreads above the center at which values are clipped; "
                       "negative means use sigmaLow");
    LSST_CONTROL_FIELD(center, std::string, "Statistics property used as the center (e.g. MEDIAN, MEAN)");
    LSST_CONTROL_FIELD(spread, std::string, "Statistics property used as the spread (e.g. STDEV)");

    SigmaClipControl() : sigmaLow(3.0), sigmaHigh(-1.0), center("MEDIAN"), spread("STDEV") {}
};

//@{
/**
 *  @brief Clamp image values into [center - sigmaLow*spread, center + sigmaHigh*spread].
 *
 *  Values are replaced by the nearest bound rather than removed.
 *
 *  @throws pex::exceptions::InvalidParameterError if sigmaLow is negative, or if center or spread is
 *          not the name of a statistics property.
 */
template <typename T>
void sigmaClipInPlace(afw::image::Image<T>& image, SigmaClipControl const& ctrl = SigmaClipControl());

template <typename T>
std::shared_ptr<afw::image::Image<T>> sigmaClip(afw::image::Image<T> const& image,
                                                SigmaClipControl const& ctrl = SigmaClipControl());
//@}

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_Background_h_INCLUDED
