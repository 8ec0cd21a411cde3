#ifndef DATAFIELD_DATAFIELD_HPP
#define DATAFIELD_DATAFIELD_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "Eigen/Core"
#include "utils/metadata.hpp"

// A data field is a regular two dimensional grid of samples, used for the
// channel images as well as for their masks and presentations.
namespace DataField {

// The samples are stored row major with shape (xres, yres), matching the
// layout of the flat sample buffer in the item tree.
using Grid =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Metadata supplied when building a data field. Every member is optional, the
// missing ones are replaced by their defaults. If given, xres and yres must
// match the shape of the grid.
struct Meta {
    std::optional<int32_t> xres;
    std::optional<int32_t> yres;
    std::optional<double> xreal;
    std::optional<double> yreal;
    std::optional<double> xoff;
    std::optional<double> yoff;
    std::optional<std::string> si_unit_xy;
    std::optional<std::string> si_unit_z;
};

struct DataField {
    Grid data;

    // Physical dimensions of the field.
    double xreal;
    double yreal;

    // Offset of the top left corner in physical units.
    double xoff;
    double yoff;

    // Lateral and value units.
    std::string si_unit_xy;
    std::string si_unit_z;
};

// Build a data field from the grid and the optional metadata. Throws
// Error::ShapeMismatch if the explicit resolution disagrees with the grid or
// if the grid is empty.
DataField create(Grid data, const Meta &meta = {});

// The resolution is always derived from the grid.
int32_t xres(const DataField &datafield);
int32_t yres(const DataField &datafield);

// Scalar metadata and its defaults: xreal = yreal = 1, xoff = yoff = 0 and
// dimensionless units.
using DoubleField = Metadata::Field<Meta, DataField, double>;
using UnitField = Metadata::UnitField<Meta, DataField>;
extern const std::array<DoubleField, 4> double_fields;
extern const std::array<UnitField, 2> unit_fields;

}  // namespace DataField

#endif /* DATAFIELD_DATAFIELD_HPP */
