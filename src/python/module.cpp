#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "gridcsv.hpp"

namespace py = pybind11;

namespace {

// datetime types, looked up once per call into the module
struct DateTypes {
    py::object dateTime;
    py::object date;

    static DateTypes import() {
        py::module_ datetime = py::module_::import("datetime");
        return DateTypes{datetime.attr("datetime"), datetime.attr("date")};
    }
};

gridcsv::CellValue toCellValue(const py::handle& obj, const DateTypes& types) {
    if (obj.is_none()) {
        return gridcsv::CellValue();
    }

    // bool first: Python bool is an int subclass
    if (py::isinstance<py::bool_>(obj)) {
        return gridcsv::CellValue(obj.cast<bool>());
    }

    if (py::isinstance<py::int_>(obj)) {
        int overflow = 0;
        long long number = PyLong_AsLongLongAndOverflow(obj.ptr(), &overflow);
        if (overflow == 0) {
            if (number == -1 && PyErr_Occurred()) {
                throw py::error_already_set();
            }
            return gridcsv::CellValue(number);
        }
        if (overflow > 0) {
            unsigned long long unsignedNumber = PyLong_AsUnsignedLongLong(obj.ptr());
            if (!PyErr_Occurred()) {
                return gridcsv::CellValue(unsignedNumber);
            }
            PyErr_Clear();
        }
        // Beyond 64 bits: keep the decimal text
        return gridcsv::CellValue(py::str(obj).cast<std::string>());
    }

    if (py::isinstance<py::float_>(obj)) {
        return gridcsv::CellValue(obj.cast<double>());
    }

    if (py::isinstance<py::str>(obj)) {
        return gridcsv::CellValue(obj.cast<std::string>());
    }

    if (py::isinstance(obj, types.dateTime)) {
        return gridcsv::CellValue(gridcsv::DateTime::fromComponents(
            obj.attr("year").cast<int>(), obj.attr("month").cast<int>(), obj.attr("day").cast<int>(),
            obj.attr("hour").cast<int>(), obj.attr("minute").cast<int>(), obj.attr("second").cast<int>()));
    }
    if (py::isinstance(obj, types.date)) {
        return gridcsv::CellValue(gridcsv::DateTime::fromComponents(
            obj.attr("year").cast<int>(), obj.attr("month").cast<int>(), obj.attr("day").cast<int>()));
    }

    return gridcsv::CellValue(py::str(obj).cast<std::string>());
}

// Mappings yield their items; other objects their public, non-callable attributes
gridcsv::FieldList extractFields(const py::handle& record, const DateTypes& types) {
    gridcsv::FieldList fields;

    if (py::isinstance<py::dict>(record)) {
        for (auto item : py::reinterpret_borrow<py::dict>(record)) {
            fields.emplace_back(py::str(item.first).cast<std::string>(), toCellValue(item.second, types));
        }
        return fields;
    }

    if (!py::hasattr(record, "__dict__")) {
        throw py::type_error("Record has no named fields: " + py::repr(record).cast<std::string>());
    }

    py::dict attributes = record.attr("__dict__");
    for (auto item : attributes) {
        std::string name = py::str(item.first).cast<std::string>();
        if (name.empty() || name[0] == '_' || PyCallable_Check(item.second.ptr())) {
            continue;
        }
        fields.emplace_back(std::move(name), toCellValue(item.second, types));
    }
    return fields;
}

py::bytes toPyBytes(const gridcsv::ByteVector& data) {
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace

PYBIND11_MODULE(gridcsv, m) {
    m.doc() = "Spreadsheet friendly CSV export (C++ core with Python bindings)";

    // Exceptions: derived translators are registered last so they run first
    auto& gridCsvError = py::register_exception<gridcsv::GridCsvError>(m, "GridCsvError", PyExc_RuntimeError);
    py::register_exception<gridcsv::EncodingError>(m, "EncodingError", gridCsvError.ptr());
    py::register_exception<gridcsv::IoError>(m, "IoError", gridCsvError.ptr());

    // Enums
    py::enum_<gridcsv::CsvOptions::Newline>(m, "Newline")
        .value("LF", gridcsv::CsvOptions::Newline::LF)
        .value("CRLF", gridcsv::CsvOptions::Newline::CRLF);

    // CsvOptions struct
    py::class_<gridcsv::CsvOptions>(m, "CsvOptions")
        .def(py::init<>())
        .def_readwrite("delimiter", &gridcsv::CsvOptions::delimiter)
        .def_readwrite("include_header", &gridcsv::CsvOptions::includeHeader)
        .def_readwrite("include_separator_hint", &gridcsv::CsvOptions::includeSeparatorHint)
        .def_readwrite("newline", &gridcsv::CsvOptions::newline)
        .def_readwrite("escape_header", &gridcsv::CsvOptions::escapeHeader)
        .def_readwrite("truncate_length", &gridcsv::CsvOptions::truncateLength)
        .def_readwrite("max_cell_length", &gridcsv::CsvOptions::maxCellLength);

    // Line iterator over a live exporter
    py::class_<gridcsv::core::CsvLineGenerator>(m, "LineIterator")
        .def("__iter__", [](gridcsv::core::CsvLineGenerator& self) -> gridcsv::core::CsvLineGenerator& {
            return self;
        }, py::return_value_policy::reference_internal)
        .def("__next__", [](gridcsv::core::CsvLineGenerator& self) -> std::string {
            auto line = self.next();
            if (!line) {
                throw py::stop_iteration();
            }
            return *line;
        });

    py::class_<gridcsv::CsvExport>(m, "CsvExport")
        .def(py::init<>())
        .def("add_row", &gridcsv::CsvExport::addRow,
             "Start a new row; following cell assignments go to it")
        .def("set_cell",
             [](gridcsv::CsvExport& self, const std::string& column, const py::handle& value) {
                 self.setCell(column, toCellValue(value, DateTypes::import()));
             },
             py::arg("column"), py::arg("value"))
        .def("__setitem__",
             [](gridcsv::CsvExport& self, const std::string& column, const py::handle& value) {
                 self.setCell(column, toCellValue(value, DateTypes::import()));
             })
        .def("add_rows",
             [](gridcsv::CsvExport& self, const py::iterable& records) {
                 std::vector<py::object> items;
                 for (auto record : records) {
                     items.push_back(py::reinterpret_borrow<py::object>(record));
                 }
                 DateTypes types = DateTypes::import();
                 self.addRows(items, [&types](const py::object& record) {
                     return extractFields(record, types);
                 });
             },
             py::arg("records"),
             "Add one row per record (dicts or objects with attributes)")
        .def_property_readonly("columns", &gridcsv::CsvExport::columns)
        .def_property_readonly("row_count", &gridcsv::CsvExport::rowCount)
        .def("clear", &gridcsv::CsvExport::clear)
        .def("lines", &gridcsv::CsvExport::lines,
             py::arg("options") = gridcsv::CsvOptions{},
             py::keep_alive<0, 1>(),
             "Iterate over CSV lines without terminators")
        .def("export",
             [](const gridcsv::CsvExport& self, const gridcsv::CsvOptions& options) {
                 return self.exportText(options);
             },
             py::arg("options") = gridcsv::CsvOptions{},
             "Export all rows as a CSV string")
        .def("export_to_file",
             [](const gridcsv::CsvExport& self, const std::string& path,
                const std::string& encoding, const gridcsv::CsvOptions& options) {
                 auto textEncoding = gridcsv::TextEncoding::fromName(encoding);
                 self.exportToFile(path, textEncoding, options);
             },
             py::arg("path"),
             py::arg("encoding") = "utf-8",
             py::arg("options") = gridcsv::CsvOptions{},
             "Write the CSV to a file, preamble first")
        .def("export_to_bytes",
             [](const gridcsv::CsvExport& self, const std::string& encoding,
                const gridcsv::CsvOptions& options) {
                 auto textEncoding = gridcsv::TextEncoding::fromName(encoding);
                 return toPyBytes(self.exportToBytes(textEncoding, options));
             },
             py::arg("encoding") = "utf-8",
             py::arg("options") = gridcsv::CsvOptions{},
             "Encode the CSV, preamble first");
}
