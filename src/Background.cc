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

#include <algorithm>
#include <vector>

#include "boost/format.hpp"

#include "lsst/log/Log.h"
#include "lsst/pex/exceptions.h"
#include "lsst/afw/math/Statistics.h"
#include "lsst/meas/aperture/Background.h"

namespace lsst {
namespace meas {
namespace aperture {

namespace {

int getStatisticsFlags(BackgroundEstimator estimator) {
    switch (estimator) {
        case MEAN:
            return afw::math::MEAN;
        case MEDIAN:
            return afw::math::MEDIAN;
        case MODE:
            return afw::math::MEAN | afw::math::MEDIAN;
    }
    throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                      (boost::format("Invalid background estimator %d") % estimator).str());
}

double reduce(BackgroundEstimator estimator, afw::math::Statistics const& stats) {
    switch (estimator) {
        case MEAN:
            return stats.getValue(afw::math::MEAN);
        case MEDIAN:
            return stats.getValue(afw::math::MEDIAN);
        case MODE:
            return 3.0 * stats.getValue(afw::math::MEDIAN) - 2.0 * stats.getValue(afw::math::MEAN);
    }
    throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                      (boost::format("Invalid background estimator %d") % estimator).str());
}

double estimateValues(BackgroundEstimator estimator, std::vector<double> const& values) {
    return reduce(estimator, afw::math::makeStatistics(values, getStatisticsFlags(estimator)));
}

// Locate x among increasing node positions for linear interpolation, holding the end values
// outside the outermost nodes.
void findNodes(std::vector<double> const& nodes, double x, std::size_t& i0, std::size_t& i1, double& t) {
    t = 0.0;
    if (x <= nodes.front()) {
        i0 = i1 = 0;
    } else if (x >= nodes.back()) {
        i0 = i1 = nodes.size() - 1;
    } else {
        i1 = std::upper_bound(nodes.begin(), nodes.end(), x) - nodes.begin();
        i0 = i1 - 1;
        t = (x - nodes[i0]) / (nodes[i1] - nodes[i0]);
    }
}

// Pixel-index centers of meshes of the given size tiling a length, the last possibly partial.
std::vector<double> computeMeshCenters(int length, int size) {
    std::vector<double> centers;
    for (int start = 0; start < length; start += size) {
        int const width = std::min(size, length - start);
        centers.push_back(start + 0.5 * (width - 1));
    }
    return centers;
}

afw::math::Property parseProperty(std::string const& name) {
    afw::math::Property const property = afw::math::stringToStatisticsProperty(name);
    if (property == afw::math::NOTHING) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Unknown statistics property '%s'") % name).str());
    }
    return property;
}

}  // namespace

BackgroundEstimator stringToBackgroundEstimator(std::string const& name) {
    if (name == "MEAN") {
        return MEAN;
    } else if (name == "MEDIAN") {
        return MEDIAN;
    } else if (name == "MODE") {
        return MODE;
    }
    throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                      (boost::format("Unknown background estimator '%s'; expected MEAN, MEDIAN or MODE") %
                       name)
                              .str());
}

template <typename T>
double estimateBackground(BackgroundEstimator estimator, afw::image::Image<T> const& image) {
    return reduce(estimator, afw::math::makeStatistics(image, getStatisticsFlags(estimator)));
}

template <typename T>
ndarray::Array<double, 1, 1> estimateBackground(BackgroundEstimator estimator,
                                                afw::image::Image<T> const& image, int dim) {
    if (dim != 0 && dim != 1) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Background dimension must be 0 or 1 (got %d)") % dim).str());
    }
    ndarray::Array<T const, 2, 1> const array = image.getArray();
    int const width = image.getWidth();
    int const height = image.getHeight();
    ndarray::Array<double, 1, 1> result = ndarray::allocate(dim == 0 ? width : height);
    std::vector<double> values;
    if (dim == 0) {
        values.resize(height);
        for (int x = 0; x < width; ++x) {
            for (int y = 0; y < height; ++y) {
                values[y] = array[y][x];
            }
            result[x] = estimateValues(estimator, values);
        }
    } else {
        values.resize(width);
        for (int y = 0; y < height; ++y) {
            std::copy(array[y].begin(), array[y].end(), values.begin());
            result[y] = estimateValues(estimator, values);
        }
    }
    return result;
}

template <typename T>
std::shared_ptr<afw::image::Image<double>> estimateBackground(BackgroundEstimator estimator,
                                                              afw::image::Image<T> const& image,
                                                              geom::Extent2I const& boxSize,
                                                              geom::Extent2I const& filterSize) {
    if (boxSize.getX() <= 0 || boxSize.getY() <= 0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Mesh size must be positive (got %dx%d)") % boxSize.getX() %
                           boxSize.getY())
                                  .str());
    }
    if (filterSize.getX() <= 0 || filterSize.getY() <= 0 || filterSize.getX() % 2 == 0 ||
        filterSize.getY() % 2 == 0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Filter size must be positive and odd (got %dx%d)") %
                           filterSize.getX() % filterSize.getY())
                                  .str());
    }
    LOG_LOGGER logger = LOG_GET("lsst.meas.aperture.Background");
    std::vector<double> const xCenters = computeMeshCenters(image.getWidth(), boxSize.getX());
    std::vector<double> const yCenters = computeMeshCenters(image.getHeight(), boxSize.getY());
    int const nx = xCenters.size();
    int const ny = yCenters.size();
    LOGL_DEBUG(logger, "Estimating background on %dx%d meshes of %dx%d pixels", nx, ny, boxSize.getX(),
               boxSize.getY());

    ndarray::Array<double, 2, 2> mesh = ndarray::allocate(ny, nx);
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            geom::Box2I const box(
                    geom::Point2I(image.getX0() + i * boxSize.getX(), image.getY0() + j * boxSize.getY()),
                    geom::Extent2I(std::min(boxSize.getX(), image.getWidth() - i * boxSize.getX()),
                                   std::min(boxSize.getY(), image.getHeight() - j * boxSize.getY())));
            afw::image::Image<T> subImage(image, box, afw::image::PARENT);
            mesh[j][i] = estimateBackground(estimator, subImage);
        }
    }

    int const hx = filterSize.getX() / 2;
    int const hy = filterSize.getY() / 2;
    ndarray::Array<double, 2, 2> filtered = ndarray::allocate(ny, nx);
    std::vector<double> window;
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            window.clear();
            for (int jj = std::max(0, j - hy); jj <= std::min(ny - 1, j + hy); ++jj) {
                for (int ii = std::max(0, i - hx); ii <= std::min(nx - 1, i + hx); ++ii) {
                    window.push_back(mesh[jj][ii]);
                }
            }
            filtered[j][i] = estimateValues(MEDIAN, window);
        }
    }

    auto result = std::make_shared<afw::image::Image<double>>(image.getBBox());
    std::vector<std::size_t> xLow(image.getWidth()), xHigh(image.getWidth());
    std::vector<double> xFrac(image.getWidth());
    for (int x = 0; x < image.getWidth(); ++x) {
        findNodes(xCenters, x, xLow[x], xHigh[x], xFrac[x]);
    }
    for (int y = 0; y < image.getHeight(); ++y) {
        std::size_t j0, j1;
        double ty;
        findNodes(yCenters, y, j0, j1, ty);
        int x = 0;
        auto const end = result->row_end(y);
        for (auto ptr = result->row_begin(y); ptr != end; ++ptr, ++x) {
            std::size_t const i0 = xLow[x];
            std::size_t const i1 = xHigh[x];
            double const tx = xFrac[x];
            double const low = (1.0 - tx) * filtered[j0][i0] + tx * filtered[j0][i1];
            double const high = (1.0 - tx) * filtered[j1][i0] + tx * filtered[j1][i1];
            *ptr = (1.0 - ty) * low + ty * high;
        }
    }
    return result;
}

template <typename T>
void sigmaClipInPlace(afw::image::Image<T>& image, SigmaClipControl const& ctrl) {
    if (ctrl.sigmaLow < 0.0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("sigmaLow must be non-negative (got %g)") % ctrl.sigmaLow).str());
    }
    double const sigmaHigh = ctrl.sigmaHigh < 0.0 ? ctrl.sigmaLow : ctrl.sigmaHigh;
    afw::math::Property const centerProperty = parseProperty(ctrl.center);
    afw::math::Property const spreadProperty = parseProperty(ctrl.spread);
    afw::math::Statistics const stats = afw::math::makeStatistics(image, centerProperty | spreadProperty);
    double const center = stats.getValue(centerProperty);
    double const spread = stats.getValue(spreadProperty);
    double const low = center - ctrl.sigmaLow * spread;
    double const high = center + sigmaHigh * spread;
    LOG_LOGGER logger = LOG_GET("lsst.meas.aperture.Background");
    LOGL_DEBUG(logger, "Clipping image values to [%g, %g]", low, high);
    for (int y = 0; y < image.getHeight(); ++y) {
        auto const end = image.row_end(y);
        for (auto ptr = image.row_begin(y); ptr != end; ++ptr) {
            if (*ptr < low) {
                *ptr = low;
            } else if (*ptr > high) {
                *ptr = high;
            }
        }
    }
}

template <typename T>
std::shared_ptr<afw::image::Image<T>> sigmaClip(afw::image::Image<T> const& image,
                                                SigmaClipControl const& ctrl) {
    auto result = std::make_shared<afw::image::Image<T>>(image, true);
    sigmaClipInPlace(*result, ctrl);
    return result;
}

#define INSTANTIATE(T)                                                                                   \
    template double estimateBackground(BackgroundEstimator, afw::image::Image<T> const&);                \
    template ndarray::Array<double, 1, 1> estimateBackground(BackgroundEstimator,                        \
                                                             afw::image::Image<T> const&, int);          \
    template std::shared_ptr<afw::image::Image<double>> estimateBackground(                              \
            BackgroundEstimator, afw::image::Image<T> const&, geom::Extent2I const&,                     \
            geom::Extent2I const&);                                                                      \
    template void sigmaClipInPlace(afw::image::Image<T>&, SigmaClipControl const&);                      \
    template std::shared_ptr<afw::image::Image<T>> sigmaClip(afw::image::Image<T> const&,                \
                                                             SigmaClipControl const&)

INSTANTIATE(float);
INSTANTIATE(double);

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
