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

#ifndef LSST_MEAS_APERTURE_AperturePhotometry_h_INCLUDED
#define LSST_MEAS_APERTURE_AperturePhotometry_h_INCLUDED

#include <string>

#include "lsst/pex/config.h"
#include "lsst/afw/image/Image.h"
#include "lsst/afw/image/MaskedImage.h"
#include "lsst/afw/table/BaseRecord.h"
#include "lsst/afw/table/Catalog.h"
#include "lsst/afw/table/FunctorKey.h"
#include "lsst/afw/table/Schema.h"
#include "lsst/meas/aperture/constants.h"
#include "lsst/meas/aperture/Aperture.h"
#include "lsst/meas/aperture/OverlapMethod.h"

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  Configuration object for aperture photometry
 */
class PhotometryControl {
public:
    LSST_CONTROL_FIELD(method, std::string,
                       "How the fraction of each pixel inside an aperture is computed: \"center\" (pixel "
                       "center inside or not), \"exact\" (analytic overlap area) or \"subpixel\" (NxN "
                       "sampling grid, N given by subpixels)");
    LSST_CONTROL_FIELD(subpixels, int,
                       "Number of samples along each pixel axis for the \"subpixel\" method; must be >= 1");
    LSST_CONTROL_FIELD(errorWeighting, std::string,
                       "How pixel variances are weighted by the overlap fraction f when computing "
                       "aperture_sum_err: \"fractionSquared\" (f^2, propagation of independent pixel "
                       "errors) or \"fraction\" (f, area-weighted variance)");

    PhotometryControl() : method("exact"), subpixels(5), errorWeighting("fractionSquared") {}
};

/**
 *  @brief The result of measuring a single aperture.
 */
struct PhotometryResult {
    CentroidElement xcenter;        ///< x position of the aperture center
    CentroidElement ycenter;        ///< y position of the aperture center
    Flux apertureSum;               ///< Sum of pixel values weighted by overlap fraction
    FluxErrElement apertureSumErr;  ///< Propagated 1-sigma uncertainty; NaN if no errors were given
    bool truncated;                 ///< Whether the aperture extends beyond the image

    /// Default constructor; initializes the sums to NaN.
    PhotometryResult();
};

/**
 *  @brief A FunctorKey for PhotometryResult
 *
 *  The fields are "xcenter", "ycenter", "aperture_sum", "flag_truncated" and, only when requested,
 *  "aperture_sum_err".
 *  The presence of the error field is a property of the schema: tables measured without an error
 *  map simply do not have it.
 */
class PhotometryResultKey : public afw::table::FunctorKey<PhotometryResult> {
public:
    /**
     *  Add the photometry fields to a Schema, and return a PhotometryResultKey that points to them.
     *
     *  @param[in,out] schema      Schema to add fields to.
     *  @param[in]     withErrors  Whether to add the aperture_sum_err field.
     */
    static PhotometryResultKey addFields(afw::table::Schema& schema, bool withErrors);

    /// Default constructor; instance will not be usable unless subsequently assigned to.
    PhotometryResultKey() : _xcenter(), _ycenter(), _apertureSum(), _apertureSumErr(), _truncated() {}

    /// Construct from a schema that already holds the fields; aperture_sum_err is optional.
    explicit PhotometryResultKey(afw::table::Schema const& schema);

    /// Get a PhotometryResult from the given record; apertureSumErr is NaN if the field is absent.
    PhotometryResult get(afw::table::BaseRecord const& record) const override;

    /// Set a PhotometryResult in the given record; apertureSumErr is ignored if the field is absent.
    void set(afw::table::BaseRecord& record, PhotometryResult const& value) const override;

    /// Return True if the position, sum and flag keys are valid.
    bool isValid() const {
        return _xcenter.isValid() && _ycenter.isValid() && _apertureSum.isValid() && _truncated.isValid();
    }

    /// Return True if the key also carries the aperture_sum_err field.
    bool hasErrors() const { return _apertureSumErr.isValid(); }

    afw::table::Key<CentroidElement> getXCenter() const { return _xcenter; }
    afw::table::Key<CentroidElement> getYCenter() const { return _ycenter; }
    afw::table::Key<Flux> getApertureSum() const { return _apertureSum; }
    afw::table::Key<FluxErrElement> getApertureSumErr() const { return _apertureSumErr; }
    afw::table::Key<afw::table::Flag> getTruncated() const { return _truncated; }

private:
    afw::table::Key<CentroidElement> _xcenter;
    afw::table::Key<CentroidElement> _ycenter;
    afw::table::Key<Flux> _apertureSum;
    afw::table::Key<FluxErrElement> _apertureSumErr;
    afw::table::Key<afw::table::Flag> _truncated;
};

/**
 *  @brief Sum pixel values within apertures, optionally propagating per-pixel errors.
 *
 *  The static computeSum methods measure a single aperture and are the building blocks for the
 *  catalog-level run methods.  For each aperture, the pixels that can overlap it are found from its
 *  bounding box (clipped to the image); apertures entirely off the image are given a sum (and error)
 *  of exactly zero without evaluating any geometry.  Otherwise an image of overlap fractions f is
 *  built for the cutout, and
 *  @f[
 *      \mathrm{sum} = \sum_i f_i v_i, \qquad \mathrm{err} = \sqrt{\sum_i w(f_i) \sigma_i^2}
 *  @f]
 *  with w(f) = f^2 or w(f) = f depending on the error weighting.  Pixel values are summed as given,
 *  including negative values.
 *
 *  All arguments are validated before any pixel is processed, so an invalid call never produces a
 *  partial result.  Instances hold no mutable state.
 */
class AperturePhotometry {
public:
    /// How pixel variances are weighted by the overlap fraction.
    enum ErrorWeighting {
        FRACTION_SQUARED = 0,  ///< f^2: propagation of independent pixel errors
        FRACTION               ///< f: area-weighted variance
    };

    typedef PhotometryControl Control;
    typedef PhotometryResult Result;

    /// @throws pex::exceptions::InvalidParameterError for a name other than "fraction" or "fractionSquared".
    static ErrorWeighting stringToErrorWeighting(std::string const& name);

    //@{
    /**
     *  @brief Compute the sum of pixel values within a single aperture.
     *
     *  @param[in]  aperture   Aperture to measure, in the parent coordinates of the image.
     *  @param[in]  image      Image to be measured.  If a MaskedImage is provided, its variance plane
     *                         is used to compute the uncertainty.
     *  @param[in]  method     Pixel overlap strategy.
     *  @param[in]  weighting  Weighting of pixel variances by overlap fraction.
     */
    template <typename T>
    static Result computeSum(Aperture const& aperture, afw::image::Image<T> const& image,
                             OverlapMethod const& method);
    template <typename T>
    static Result computeSum(Aperture const& aperture, afw::image::MaskedImage<T> const& image,
                             OverlapMethod const& method, ErrorWeighting weighting = FRACTION_SQUARED);
    //@}

    /**
     *  @brief Compute the sum of pixel values within a single aperture, with its uncertainty.
     *
     *  @param[in]  aperture   Aperture to measure, in the parent coordinates of the image.
     *  @param[in]  image      Image to be measured.
     *  @param[in]  error      Per-pixel 1-sigma uncertainties, with the same bounding box as image.
     *  @param[in]  method     Pixel overlap strategy.
     *  @param[in]  weighting  Weighting of pixel variances by overlap fraction.
     *
     *  @throws pex::exceptions::LengthError if the bounding boxes of image and error differ.
     */
    template <typename T>
    static Result computeSum(Aperture const& aperture, afw::image::Image<T> const& image,
                             afw::image::Image<T> const& error, OverlapMethod const& method,
                             ErrorWeighting weighting = FRACTION_SQUARED);

    /**
     *  @brief Validate the configuration and build the output schemas.
     *
     *  @throws pex::exceptions::InvalidParameterError if the method, subpixel count or error weighting
     *          is invalid.
     */
    explicit AperturePhotometry(Control const& ctrl = Control());

    Control const& getControl() const { return _ctrl; }

    OverlapMethod const& getMethod() const { return _method; }

    ErrorWeighting getErrorWeighting() const { return _weighting; }

    /// Return the schema of catalogs produced with (withErrors=true) or without an error map.
    afw::table::Schema const& getSchema(bool withErrors) const {
        return withErrors ? _errorSchema : _schema;
    }

    //@{
    /**
     *  @brief Measure every aperture and return one record per aperture, in order.
     *
     *  The catalog schema contains aperture_sum_err only in the overloads that take errors (an
     *  explicit error image, or a MaskedImage).
     *
     *  @throws pex::exceptions::InvalidParameterError if any aperture pointer is null.
     *  @throws pex::exceptions::LengthError if the error image does not match the image.
     */
    template <typename T>
    afw::table::BaseCatalog run(ApertureVector const& apertures, afw::image::Image<T> const& image) const;
    template <typename T>
    afw::table::BaseCatalog run(ApertureVector const& apertures, afw::image::Image<T> const& image,
                                afw::image::Image<T> const& error) const;
    template <typename T>
    afw::table::BaseCatalog run(ApertureVector const& apertures,
                                afw::image::MaskedImage<T> const& image) const;
    //@}

    //@{
    /// Measure a single aperture, returning a catalog with one record.
    template <typename T>
    afw::table::BaseCatalog run(Aperture const& aperture, afw::image::Image<T> const& image) const;
    template <typename T>
    afw::table::BaseCatalog run(Aperture const& aperture, afw::image::Image<T> const& image,
                                afw::image::Image<T> const& error) const;
    template <typename T>
    afw::table::BaseCatalog run(Aperture const& aperture, afw::image::MaskedImage<T> const& image) const;
    //@}

private:
    Control _ctrl;
    OverlapMethod _method;
    ErrorWeighting _weighting;
    afw::table::Schema _schema;
    PhotometryResultKey _key;
    afw::table::Schema _errorSchema;
    PhotometryResultKey _errorKey;
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_AperturePhotometry_h_INCLUDED
