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

#ifndef LSST_MEAS_APERTURE_OverlapMethod_h_INCLUDED
#define LSST_MEAS_APERTURE_OverlapMethod_h_INCLUDED

#include <string>

namespace lsst {
namespace meas {
namespace aperture {

/**
 *  @brief Selects how the fraction of a pixel covered by an aperture is computed.
 *
 *  - CENTER counts a pixel fully if its center lies strictly inside the aperture, and not at all
 *    otherwise.  It never credits a pixel whose center falls just outside a boundary, and is
 *    therefore biased low relative to EXACT.
 *  - EXACT uses the analytic area of intersection between the pixel and the aperture.
 *  - SUBPIXEL divides each pixel into an NxN grid of equal cells and counts the fraction of cell
 *    centers inside the aperture.  The result is deterministic, and SUBPIXEL with N=1 samples only
 *    the pixel center, so it is identical to CENTER.
 *
 *  OverlapMethod is an immutable value; invalid selections are rejected when it is constructed.
 */
class OverlapMethod {
public:
    enum Type { CENTER = 0, EXACT, SUBPIXEL };

    static OverlapMethod center() { return OverlapMethod(CENTER, 1); }

    static OverlapMethod exact() { return OverlapMethod(EXACT, 1); }

    /**
     *  @brief Construct a subpixel method with an NxN sampling grid.
     *
     *  @throws pex::exceptions::InvalidParameterError if subpixels < 1.
     */
    static OverlapMethod subpixel(int subpixels);

    /**
     *  @brief Construct a method from its name ("center", "exact" or "subpixel").
     *
     *  The subpixel count is only used (and only validated) for "subpixel".
     *
     *  @throws pex::exceptions::InvalidParameterError for an unrecognized name or a bad count.
     */
    static OverlapMethod fromString(std::string const& name, int subpixels = 5);

    Type getType() const { return _type; }

    /// Number of samples along each pixel axis; 1 for CENTER and EXACT.
    int getSubpixels() const { return _subpixels; }

    /// Return a string such as "exact" or "subpixel(10)" for messages.
    std::string toString() const;

    bool operator==(OverlapMethod const& other) const {
        return _type == other._type && _subpixels == other._subpixels;
    }
    bool operator!=(OverlapMethod const& other) const { return !(*this == other); }

private:
    OverlapMethod(Type type, int subpixels) : _type(type), _subpixels(subpixels) {}

    Type _type;
    int _subpixels;
};

}  // namespace aperture
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_APERTURE_OverlapMethod_h_INCLUDED
