#include <sstream>

#include "datafield/datafield.hpp"
#include "utils/error.hpp"

const std::array<DataField::DoubleField, 4> DataField::double_fields = {{
    {"xreal", &Meta::xreal, &DataField::xreal, 1.0},
    {"yreal", &Meta::yreal, &DataField::yreal, 1.0},
    {"xoff", &Meta::xoff, &DataField::xoff, 0.0},
    {"yoff", &Meta::yoff, &DataField::yoff, 0.0},
}};

const std::array<DataField::UnitField, 2> DataField::unit_fields = {{
    {"si_unit_xy", &Meta::si_unit_xy, &DataField::si_unit_xy},
    {"si_unit_z", &Meta::si_unit_z, &DataField::si_unit_z},
}};

DataField::DataField DataField::create(Grid data, const Meta &meta) {
    if (data.rows() == 0 || data.cols() == 0) {
        std::ostringstream error_stream;
        error_stream << "data field can't be empty, got shape (" << data.rows()
                     << ", " << data.cols() << ")";
        throw Error::ShapeMismatch("", error_stream.str());
    }
    bool xres_matches = !meta.xres || meta.xres.value() == data.rows();
    bool yres_matches = !meta.yres || meta.yres.value() == data.cols();
    if (!xres_matches || !yres_matches) {
        std::ostringstream error_stream;
        error_stream << "resolution (" << meta.xres.value_or(data.rows())
                     << ", " << meta.yres.value_or(data.cols())
                     << ") doesn't match the data shape (" << data.rows()
                     << ", " << data.cols() << ")";
        throw Error::ShapeMismatch("", error_stream.str());
    }

    DataField datafield = {};
    datafield.data = std::move(data);
    Metadata::resolve_all(double_fields, meta, &datafield);
    Metadata::resolve_all(unit_fields, meta, &datafield);
    return datafield;
}

int32_t DataField::xres(const DataField &datafield) {
    return static_cast<int32_t>(datafield.data.rows());
}

int32_t DataField::yres(const DataField &datafield) {
    return static_cast<int32_t>(datafield.data.cols());
}
