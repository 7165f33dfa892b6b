// snowflake_bindings.cpp
#include "flake/id/default.hpp"
#include "flake/id/snowflake.hpp"

#include <memory>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

using flake::id::Layout;
using flake::id::Snowflake;

namespace {
py::dict convert_statistics_to_dict(const Snowflake::Statistics& stats) {
    py::dict result;
    result["total_ids_generated"] = stats.total_ids_generated;
    result["sequence_rollovers"] = stats.sequence_rollovers;
    result["timestamp_wait_count"] = stats.timestamp_wait_count;
    result["clock_regressions"] = stats.clock_regressions;
    return result;
}

py::dict convert_parts_to_dict(const flake::id::IdParts& parts) {
    py::dict result;
    result["timestamp"] = parts.timestamp;
    result["center_id"] = parts.center_id;
    result["worker_id"] = parts.worker_id;
    result["sequence"] = parts.sequence;
    return result;
}
}  // namespace

PYBIND11_MODULE(flake_snowflake, m) {
    m.doc() = R"pbdoc(
        Snowflake ID Generator
        -----------------------

        64-bit, time-ordered unique ids composed of:
          - 41 bits of milliseconds since EPOCH (2023-04-05 06:07:08 UTC)
          - 5 bits of center id
          - 5 bits of worker id
          - 12 bits of sequence (for ids generated in the same millisecond)

        Example:
            >>> import flake_snowflake
            >>> generator = flake_snowflake.SnowflakeGenerator(1, 2)
            >>> id = generator.next_id()
            >>> generator.parse_id(id)["worker_id"]
            2
    )pbdoc";

    // Register exception translations
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const flake::id::InvalidCenterIdException& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const flake::id::InvalidWorkerIdException& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const flake::id::ConfigException& e) {
            PyErr_SetString(PyExc_ValueError, e.what());
        } catch (const flake::id::SnowflakeException& e) {
            PyErr_SetString(PyExc_RuntimeError, e.what());
        }
    });

    py::class_<Snowflake>(m, "SnowflakeGenerator",
                          R"(Distributed unique ID generator.

Args:
    center_id: ID of the center hosting this node (0-31)
    worker_id: ID of the node within its center (0-31)

Raises:
    ValueError: If either ID is out of range
)")
        .def(py::init([](flake::id::u64 center_id, flake::id::u64 worker_id) {
                 return std::make_unique<Snowflake>(center_id, worker_id);
             }),
             py::arg("center_id") = Layout::DEFAULT_CENTER_ID,
             py::arg("worker_id") = Layout::DEFAULT_WORKER_ID)
        .def("next_id", &Snowflake::nextId,
             py::call_guard<py::gil_scoped_release>(),
             R"(Generates a single unique ID.

Raises:
    RuntimeError: If the system clock moved backwards beyond tolerance
)")
        .def("next_id_string", &Snowflake::nextIdString,
             py::call_guard<py::gil_scoped_release>(),
             "Generates a single unique ID as a decimal string.")
        .def(
            "next_ids",
            [](Snowflake& self, size_t count) {
                if (count == 0) {
                    throw py::value_error("Count must be greater than zero");
                }
                py::gil_scoped_release release;
                return self.nextIds(count);
            },
            py::arg("count") = 1,
            R"(Generates multiple unique IDs at once.

Args:
    count: Number of IDs to generate (default is 1)

Returns:
    List of unique IDs in increasing order
)")
        .def("validate_id", &Snowflake::validateId, py::arg("id"),
             "Returns True if the ID carries this generator's center and "
             "worker IDs and is not from the future.")
        .def_static("extract_timestamp", &Snowflake::extractTimestamp,
                    py::arg("id"),
                    "Extracts the timestamp (Unix milliseconds) from an ID.")
        .def_static(
            "parse_id",
            [](flake::id::u64 id) {
                return convert_parts_to_dict(Snowflake::parseId(id));
            },
            py::arg("id"),
            R"(Parses a Snowflake ID into its constituent parts.

Returns:
    Dictionary with 'timestamp', 'center_id', 'worker_id', and 'sequence'
)")
        .def_property_readonly("center_id", &Snowflake::getCenterId)
        .def_property_readonly("worker_id", &Snowflake::getWorkerId)
        .def(
            "get_statistics",
            [](const Snowflake& self) {
                return convert_statistics_to_dict(self.getStatistics());
            },
            "Returns statistics about ID generation.");

    m.def("next_id", &flake::id::nextId,
          py::call_guard<py::gil_scoped_release>(),
          "Next ID of the process-wide default generator.");
    m.def("next_id_string", &flake::id::nextIdString,
          py::call_guard<py::gil_scoped_release>(),
          "Next ID of the default generator as a decimal string.");
    m.def("dynamic_next_id", &flake::id::dynamicNextId,
          py::call_guard<py::gil_scoped_release>(),
          "Next ID of the generator whose IDs derive from this host.");
    m.def("dynamic_next_id_string", &flake::id::dynamicNextIdString,
          py::call_guard<py::gil_scoped_release>(),
          "Next ID of the dynamic generator as a decimal string.");

    // Add constants
    m.attr("EPOCH") = Layout::EPOCH;
    m.attr("CENTER_ID_BITS") = Layout::CENTER_ID_BITS;
    m.attr("WORKER_ID_BITS") = Layout::WORKER_ID_BITS;
    m.attr("SEQUENCE_BITS") = Layout::SEQUENCE_BITS;
    m.attr("MAX_CENTER_ID") = Layout::MAX_CENTER_ID;
    m.attr("MAX_WORKER_ID") = Layout::MAX_WORKER_ID;
}
