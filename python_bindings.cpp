#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <string>
#include <vector>

#include "ymodem/tx/chunker.hpp"
#include "ymodem/tx/packet.hpp"
#include "ymodem/utils/crc.hpp"

namespace py = pybind11;

// Helper function to convert Python bytes to a C++ byte vector
std::vector<uint8_t> bytes_to_vector(const py::bytes& input) {
    std::string raw = input;
    return std::vector<uint8_t>(raw.begin(), raw.end());
}

// Helper function to convert a C++ byte vector to Python bytes
py::bytes vector_to_bytes(const std::vector<uint8_t>& vec) {
    return py::bytes(reinterpret_cast<const char*>(vec.data()), vec.size());
}

PYBIND11_MODULE(ymodem_py, m) {
    m.doc() = "YMODEM framing Python Bindings";

    // Chunk class
    py::class_<ymodem::tx::Chunk>(m, "Chunk")
        .def(py::init<>())
        .def_readwrite("offset", &ymodem::tx::Chunk::offset)
        .def_readwrite("length", &ymodem::tx::Chunk::length)
        .def_readwrite("block", &ymodem::tx::Chunk::block)
        .def_readwrite("packet_size", &ymodem::tx::Chunk::packet_size);

    m.def("crc16", [](const py::bytes& data) {
        auto vec = bytes_to_vector(data);
        return ymodem::utils::crc16(vec);
    }, "CRC-16/XMODEM of a byte string", py::arg("data"));

    m.def("build_data_packet", [](const py::bytes& chunk, uint8_t block, std::size_t packet_size) {
        auto vec = bytes_to_vector(chunk);
        return vector_to_bytes(ymodem::tx::build_data_packet(vec, block, packet_size));
    }, "Frame one data packet", py::arg("chunk"), py::arg("block"), py::arg("packet_size") = 1024);

    m.def("build_header_packet", [](const std::string& filename, uint64_t file_size) {
        return vector_to_bytes(ymodem::tx::build_header_packet(filename, file_size));
    }, "Frame the block-0 header packet", py::arg("filename"), py::arg("file_size"));

    m.def("build_terminator_packet", []() {
        return vector_to_bytes(ymodem::tx::build_terminator_packet());
    }, "Frame the empty end-of-batch packet");

    m.def("plan_chunks", &ymodem::tx::plan_chunks,
          "Split a file size into data packet chunks", py::arg("file_size"));
}
