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

#include "boost/format.hpp"
#include "ndarray/eigen.h"

#include "lsst/log/Log.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/aperture/AperturePhotometry.h"

namespace lsst {
namespace meas {
namespace aperture {

PhotometryResult::PhotometryResult()
        : xcenter(std::numeric_limits<CentroidElement>::quiet_NaN()),
          ycenter(std::numeric_limits<CentroidElement>::quiet_NaN()),
          apertureSum(std::numeric_limits<Flux>::quiet_NaN()),
          apertureSumErr(std::numeric_limits<FluxErrElement>::quiet_NaN()),
          truncated(false) {}

PhotometryResultKey PhotometryResultKey::addFields(afw::table::Schema& schema, bool withErrors) {
    PhotometryResultKey result;
    result._xcenter = schema.addField<CentroidElement>("xcenter", "x position of the aperture center", "pixel");
    result._ycenter = schema.addField<CentroidElement>("ycenter", "y position of the aperture center", "pixel");
    result._apertureSum = schema.addField<Flux>(
            "aperture_sum", "sum of pixel values weighted by the fraction of each pixel in the aperture",
            "count");
    if (withErrors) {
        result._apertureSumErr = schema.addField<FluxErrElement>(
                "aperture_sum_err", "1-sigma aperture_sum uncertainty", "count");
    }
    result._truncated = schema.addField<afw::table::Flag>(
            "flag_truncated", "aperture extends beyond the image; only pixels on the image were summed");
    return result;
}

PhotometryResultKey::PhotometryResultKey(afw::table::Schema const& schema)
        : _xcenter(schema["xcenter"]),
          _ycenter(schema["ycenter"]),
          _apertureSum(schema["aperture_sum"]),
          _truncated(schema["flag_truncated"]) {
    if (schema.getNames().count("aperture_sum_err")) {
        _apertureSumErr = schema["aperture_sum_err"];
    }
}

PhotometryResult PhotometryResultKey::get(afw::table::BaseRecord const& record) const {
    PhotometryResult r;
    r.xcenter = record.get(_xcenter);
    r.ycenter = record.get(_ycenter);
    r.apertureSum = record.get(_apertureSum);
    if (hasErrors()) {
        r.apertureSumErr = record.get(_apertureSumErr);
    }
    r.truncated = record.get(_truncated);
    return r;
}

void PhotometryResultKey::set(afw::table::BaseRecord& record, PhotometryResult const& value) const {
    record.set(_xcenter, value.xcenter);
    record.set(_ycenter, value.ycenter);
    record.set(_apertureSum, value.apertureSum);
    if (hasErrors()) {
        record.set(_apertureSumErr, value.apertureSumErr);
    }
    record.set(_truncated, value.truncated);
}

namespace {

// Fill in the center and find the pixels that can overlap the aperture; an empty box means the
// aperture misses the image entirely and the sums are already final.
geom::Box2I prepareResult(Aperture const& aperture, geom::Box2I const& imageBBox,
                          PhotometryResult& result, bool withErrors) {
    LOG_LOGGER logger = LOG_GET("lsst.meas.aperture.AperturePhotometry");
    result.xcenter = aperture.getCenter().getX();
    result.ycenter = aperture.getCenter().getY();
    result.apertureSum = 0.0;
    if (withErrors) {
        result.apertureSumErr = 0.0;
    }
    result.truncated = !geom::Box2D(imageBBox).contains(aperture.computeBBox());
    geom::Box2I cutout = aperture.computeCutout(imageBBox);
    if (cutout.isEmpty()) {
        LOGL_DEBUG(logger, "Aperture at (%g, %g) does not overlap image", result.xcenter, result.ycenter);
    } else if (result.truncated) {
        LOGL_DEBUG(logger, "Aperture at (%g, %g) truncated by image boundary", result.xcenter,
                   result.ycenter);
    }
    return cutout;
}

template <typename T>
void checkErrorImage(afw::image::Image<T> const& image, afw::image::Image<T> const& error) {
    if (image.getBBox() != error.getBBox()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Error image (%dx%d at %d,%d) does not match image (%dx%d at %d,%d)") %
                           error.getWidth() % error.getHeight() % error.getX0() % error.getY0() %
                           image.getWidth() % image.getHeight() % image.getX0() % image.getY0())
                                  .str());
    }
}

void checkApertures(ApertureVector const& apertures) {
    for (std::size_t i = 0; i < apertures.size(); ++i) {
        if (!apertures[i]) {
            throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                              (boost::format("Aperture %d is null") % i).str());
        }
    }
}

}  // namespace

AperturePhotometry::ErrorWeighting AperturePhotometry::stringToErrorWeighting(std::string const& name) {
    if (name == "fractionSquared") {
        return FRACTION_SQUARED;
    } else if (name == "fraction") {
        return FRACTION;
    }
    throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                      (boost::format("Unknown error weighting '%s'; expected 'fraction' or 'fractionSquared'") %
                       name)
                              .str());
}

template <typename T>
AperturePhotometry::Result AperturePhotometry::computeSum(Aperture const& aperture,
                                                          afw::image::Image<T> const& image,
                                                          OverlapMethod const& method) {
    Result result;
    geom::Box2I const cutout = prepareResult(aperture, image.getBBox(), result, false);
    if (cutout.isEmpty()) return result;
    std::shared_ptr<afw::image::Image<OverlapElement>> weights = aperture.computeOverlapImage(cutout, method);
    afw::image::Image<T> subImage(image, cutout, afw::image::PARENT);
    result.apertureSum = (ndarray::asEigenArray(subImage.getArray()).template cast<double>() *
                          ndarray::asEigenArray(weights->getArray()))
                                 .sum();
    return result;
}

template <typename T>
AperturePhotometry::Result AperturePhotometry::computeSum(Aperture const& aperture,
                                                          afw::image::Image<T> const& image,
                                                          afw::image::Image<T> const& error,
                                                          OverlapMethod const& method,
                                                          ErrorWeighting weighting) {
    checkErrorImage(image, error);
    Result result;
    geom::Box2I const cutout = prepareResult(aperture, image.getBBox(), result, true);
    if (cutout.isEmpty()) return result;
    std::shared_ptr<afw::image::Image<OverlapElement>> weights = aperture.computeOverlapImage(cutout, method);
    afw::image::Image<T> subImage(image, cutout, afw::image::PARENT);
    afw::image::Image<T> subError(error, cutout, afw::image::PARENT);
    auto w = ndarray::asEigenArray(weights->getArray());
    auto sigma = ndarray::asEigenArray(subError.getArray()).template cast<double>();
    result.apertureSum = (ndarray::asEigenArray(subImage.getArray()).template cast<double>() * w).sum();
    double variance = 0.0;
    if (weighting == FRACTION) {
        variance = (sigma.square() * w).sum();
    } else {
        variance = (sigma.square() * w.square()).sum();
    }
    result.apertureSumErr = std::sqrt(variance);
    return result;
}

template <typename T>
AperturePhotometry::Result AperturePhotometry::computeSum(Aperture const& aperture,
                                                          afw::image::MaskedImage<T> const& image,
                                                          OverlapMethod const& method,
                                                          ErrorWeighting weighting) {
    Result result;
    geom::Box2I const cutout = prepareResult(aperture, image.getBBox(), result, true);
    if (cutout.isEmpty()) return result;
    std::shared_ptr<afw::image::Image<OverlapElement>> weights = aperture.computeOverlapImage(cutout, method);
    afw::image::MaskedImage<T> subImage(image, cutout, afw::image::PARENT);
    auto w = ndarray::asEigenArray(weights->getArray());
    auto variance = ndarray::asEigenArray(subImage.getVariance()->getArray()).template cast<double>();
    result.apertureSum =
            (ndarray::asEigenArray(subImage.getImage()->getArray()).template cast<double>() * w).sum();
    if (weighting == FRACTION) {
        result.apertureSumErr = std::sqrt((variance * w).sum());
    } else {
        result.apertureSumErr = std::sqrt((variance * w.square()).sum());
    }
    return result;
}

AperturePhotometry::AperturePhotometry(Control const& ctrl)
        : _ctrl(ctrl),
          _method(OverlapMethod::fromString(ctrl.method, ctrl.subpixels)),
          _weighting(stringToErrorWeighting(ctrl.errorWeighting)),
          _schema(),
          _key(PhotometryResultKey::addFields(_schema, false)),
          _errorSchema(),
          _errorKey(PhotometryResultKey::addFields(_errorSchema, true)) {
    if (ctrl.subpixels < 1) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Number of subpixels must be at least 1 (got %d)") % ctrl.subpixels)
                                  .str());
    }
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(ApertureVector const& apertures,
                                                afw::image::Image<T> const& image) const {
    checkApertures(apertures);
    afw::table::BaseCatalog catalog(_schema);
    catalog.reserve(apertures.size());
    for (auto const& aperture : apertures) {
        _key.set(*catalog.addNew(), computeSum(*aperture, image, _method));
    }
    return catalog;
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(ApertureVector const& apertures,
                                                afw::image::Image<T> const& image,
                                                afw::image::Image<T> const& error) const {
    checkApertures(apertures);
    checkErrorImage(image, error);
    afw::table::BaseCatalog catalog(_errorSchema);
    catalog.reserve(apertures.size());
    for (auto const& aperture : apertures) {
        _errorKey.set(*catalog.addNew(), computeSum(*aperture, image, error, _method, _weighting));
    }
    return catalog;
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(ApertureVector const& apertures,
                                                afw::image::MaskedImage<T> const& image) const {
    checkApertures(apertures);
    afw::table::BaseCatalog catalog(_errorSchema);
    catalog.reserve(apertures.size());
    for (auto const& aperture : apertures) {
        _errorKey.set(*catalog.addNew(), computeSum(*aperture, image, _method, _weighting));
    }
    return catalog;
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(Aperture const& aperture,
                                                afw::image::Image<T> const& image) const {
    afw::table::BaseCatalog catalog(_schema);
    _key.set(*catalog.addNew(), computeSum(aperture, image, _method));
    return catalog;
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(Aperture const& aperture, afw::image::Image<T> const& image,
                                                afw::image::Image<T> const& error) const {
    checkErrorImage(image, error);
    afw::table::BaseCatalog catalog(_errorSchema);
    _errorKey.set(*catalog.addNew(), computeSum(aperture, image, error, _method, _weighting));
    return catalog;
}

template <typename T>
afw::table::BaseCatalog AperturePhotometry::run(Aperture const& aperture,
                                                afw::image::MaskedImage<T> const& image) const {
    afw::table::BaseCatalog catalog(_errorSchema);
    _errorKey.set(*catalog.addNew(), computeSum(aperture, image, _method, _weighting));
    return catalog;
}

#define INSTANTIATE(T)                                                                                    \
    template AperturePhotometry::Result AperturePhotometry::computeSum(                                   \
            Aperture const&, afw::image::Image<T> const&, OverlapMethod const&);                          \
    template AperturePhotometry::Result AperturePhotometry::computeSum(                                   \
            Aperture const&, afw::image::Image<T> const&, afw::image::Image<T> const&,                    \
            OverlapMethod const&, ErrorWeighting);                                                        \
    template AperturePhotometry::Result AperturePhotometry::computeSum(                                   \
            Aperture const&, afw::image::MaskedImage<T> const&, OverlapMethod const&, ErrorWeighting);    \
    template afw::table::BaseCatalog AperturePhotometry::run(ApertureVector const&,                       \
                                                             afw::image::Image<T> const&) const;          \
    template afw::table::BaseCatalog AperturePhotometry::run(                                             \
            ApertureVector const&, afw::image::Image<T> const&, afw::image::Image<T> const&) const;       \
    template afw::table::BaseCatalog AperturePhotometry::run(ApertureVector const&,                       \
                                                             afw::image::MaskedImage<T> const&) const;    \
    template afw::table::BaseCatalog AperturePhotometry::run(Aperture const&, afw::image::Image<T> const&) \
            const;                                                                                        \
    template afw::table::BaseCatalog AperturePhotometry::run(Aperture const&, afw::image::Image<T> const&, \
                                                             afw::image::Image<T> const&) const;          \
    template afw::table::BaseCatalog AperturePhotometry::run(Aperture const&,                             \
                                                             afw::image::MaskedImage<T> const&) const

INSTANTIATE(float);
INSTANTIATE(double);

}  // namespace aperture
}  // namespace meas
}  // namespace lsst
