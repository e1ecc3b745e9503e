// This file is part of the sfs software suite.
// Copyright (C) 2025 sfs Developers.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.


#include "SampleMap.hpp"
#include "Shape.hpp"
#include "SiteReader.hpp"
#include "Spectrum.hpp"
#include "SpectrumCreator.hpp"
#include "SpectrumIO.hpp"
#include "Statistics.hpp"
#include "VcfReader.hpp"

#include <Eigen/Core>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

Eigen::VectorXd to_numpy(const Array& array) {
    return Eigen::Map<const Eigen::VectorXd>(array.data().data(),
                                            static_cast<Eigen::Index>(array.elements()));
}

template <typename State>
std::string repr(const Spectrum<State>& spectrum) {
    std::ostringstream oss;
    oss << spectrum;
    return oss.str();
}

// Members shared by both spectrum states
template <typename State>
void bind_spectrum_common(py::class_<Spectrum<State>>& cls) {
    using S = Spectrum<State>;
    cls.def_property_readonly("shape", [](const S& s) { return s.shape().values(); })
        .def_property_readonly("dimensions", &S::dimensions)
        .def_property_readonly("elements", &S::elements)
        .def("data", [](const S& s) { return to_numpy(s.inner()); })
        .def("sum", &S::sum)
        .def("__getitem__", [](const S& s, const std::vector<std::size_t>& index) { return s[index]; })
        .def("fold", &S::fold, py::arg("fill") = 0.0)
        .def("marginalize", &S::marginalize, py::arg("axes"))
        .def("project", [](const S& s, const std::vector<std::size_t>& to) { return s.project(Shape(to)); },
             py::arg("project_to"))
        .def("into_normalized", &S::into_normalized)
        .def("pi", [](const S& s) { return pi(s); })
        .def("theta_watterson", [](const S& s) { return theta_watterson(s); })
        .def("king", [](const S& s) { return king(s); })
        .def("r0", [](const S& s) { return r0(s); })
        .def("r1", [](const S& s) { return r1(s); })
        .def("__eq__", [](const S& a, const S& b) { return a == b; })
        .def("__repr__", &repr<State>);
}

Scs create_scs(const std::string& vcf_path, const std::optional<std::string>& samples_path,
               const std::optional<std::vector<std::size_t>>& project_to, bool strict) {
    auto reader = VcfReader::from_path(vcf_path);
    SampleMap sample_map =
        samples_path ? SampleMap::from_path(*samples_path) : SampleMap::from_all(reader->samples());
    std::optional<Shape> shape;
    if (project_to) {
        shape = Shape(*project_to);
    }
    SiteReader site_reader(std::move(reader), std::move(sample_map), shape);
    SpectrumCreator creator(site_reader, strict);
    return creator.run();
}

} // namespace

PYBIND11_MODULE(sfs_python_bindings, m) {
  py::register_exception<ShapeError>(m, "ShapeError", PyExc_ValueError);
  py::register_exception<MarginalizationError>(m, "MarginalizationError", PyExc_ValueError);
  py::register_exception<ProjectionError>(m, "ProjectionError", PyExc_ValueError);
  py::register_exception<StatisticError>(m, "StatisticError", PyExc_ValueError);
  py::register_exception<SpectrumFormatError>(m, "SpectrumFormatError", PyExc_IOError);
  py::register_exception<GenotypeReaderError>(m, "GenotypeReaderError", PyExc_IOError);
  py::register_exception<SampleMapError>(m, "SampleMapError", PyExc_ValueError);
  py::register_exception<StrictModeError>(m, "StrictModeError", PyExc_RuntimeError);

  py::class_<Scs> scs(m, "Scs");
  scs.def(py::init([](const Eigen::VectorXd& data, const std::vector<std::size_t>& shape) {
            return Scs::from_data(std::vector<double>(data.data(), data.data() + data.size()), Shape(shape));
          }),
          "Initialize", py::arg("data"), py::arg("shape"))
      .def_static("from_zeros", [](const std::vector<std::size_t>& shape) { return Scs::from_zeros(Shape(shape)); },
                  py::arg("shape"))
      .def("normalize", &Scs::normalize)
      .def("segregating_sites", &Scs::segregating_sites)
      .def("tajima_d", [](const Scs& s) { return tajima_d(s); })
      .def("fu_li_d", [](const Scs& s) { return fu_li_d(s); })
      .def("write", [](const Scs& s, const std::string& path, bool npy, std::size_t precision) {
             write_spectrum_to_path(path, s, npy ? SpectrumFormat::Npy : SpectrumFormat::Text, precision);
           },
           py::arg("path"), py::arg("npy") = false, py::arg("precision") = DEFAULT_PRECISION);
  bind_spectrum_common(scs);

  py::class_<Sfs> sfs(m, "Sfs");
  sfs.def("f2", [](const Sfs& s) { return f2(s); })
      .def("f3", [](const Sfs& s) { return f3(s); })
      .def("f4", [](const Sfs& s) { return f4(s); })
      .def("fst", [](const Sfs& s) { return fst(s); })
      .def("heterozygosity", [](const Sfs& s) { return heterozygosity(s); })
      .def("write", [](const Sfs& s, const std::string& path, bool npy, std::size_t precision) {
             write_spectrum_to_path(path, s, npy ? SpectrumFormat::Npy : SpectrumFormat::Text, precision);
           },
           py::arg("path"), py::arg("npy") = false, py::arg("precision") = DEFAULT_PRECISION);
  bind_spectrum_common(sfs);

  m.def("read_scs", [](const std::string& path) { return read_scs_from_path(path); }, py::arg("path"));
  m.def("create_scs", &create_scs, "Create a site count spectrum from an uncompressed VCF",
        py::arg("vcf_path"), py::arg("samples_path") = py::none(), py::arg("project_to") = py::none(),
        py::arg("strict") = false);
}
