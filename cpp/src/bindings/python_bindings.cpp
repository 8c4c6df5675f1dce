#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/numpy.h>
#include "libkinship/errors.hpp"
#include "libkinship/gower.hpp"
#include "libkinship/linear_kinship.hpp"

#include <string>

namespace py = pybind11;
using namespace libkinship;

namespace {

using StridedMap = Eigen::Map<Eigen::MatrixXd, 0, Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>>;

// Views a writeable 2-D float64 NumPy array in place, whatever its memory order.
StridedMap map_output(py::object obj, const char* name) {
    if (!py::isinstance<py::array_t<double>>(obj)) {
        throw py::type_error(std::string(name) + " must be a float64 numpy array");
    }
    auto array = py::reinterpret_borrow<py::array_t<double>>(obj);
    if (array.ndim() != 2) {
        throw ShapeMismatchError(std::string(name) + " must be 2-dimensional");
    }
    if (!array.writeable()) {
        throw py::value_error(std::string(name) + " is read-only");
    }
    const auto item = static_cast<Eigen::Index>(sizeof(double));
    return StridedMap(array.mutable_data(), array.shape(0), array.shape(1),
                      Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>(array.strides(1) / item, array.strides(0) / item));
}

Eigen::MatrixXd as_matrix(py::object obj, const char* name) {
    auto array = py::array_t<double, py::array::forcecast>::ensure(obj);
    if (!array) {
        throw py::type_error(std::string(name) + " must be convertible to a float64 array");
    }
    if (array.ndim() != 2) {
        throw ShapeMismatchError(std::string(name) + " must be 2-dimensional, got " + std::to_string(array.ndim()) +
                                 " dimensions");
    }
    const auto item = static_cast<Eigen::Index>(sizeof(double));
    using ConstStridedMap = Eigen::Map<const Eigen::MatrixXd, 0, Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>>;
    return ConstStridedMap(array.data(), array.shape(0), array.shape(1),
                           Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>(array.strides(1) / item,
                                                                         array.strides(0) / item));
}

}  // namespace

PYBIND11_MODULE(_libkinship, m) {
    m.doc() = "libkinship python bindings";

    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError", PyExc_ValueError);

    m.def("linear_kinship",
          [](py::object G, py::object out, bool progress, std::size_t max_chunks) -> py::object {
              const Eigen::MatrixXd features = as_matrix(G, "G");
              KinshipOptions options;
              options.progress = progress;
              options.max_chunks = max_chunks;
              if (out.is_none()) {
                  return py::cast(linear_kinship(features, options));
              }
              auto target = map_output(out, "out");
              Eigen::MatrixXd accumulator = target;
              linear_kinship(features, accumulator, options);
              target = accumulator;
              return out;
          },
          py::arg("G"), py::arg("out") = py::none(), py::arg("progress") = true,
          py::arg("max_chunks") = KinshipOptions{}.max_chunks,
          "Estimate the kinship matrix of G (samples x features) via a linear kernel.");

    m.def("gower_norm",
          [](py::object K, py::object out) -> py::object {
              const Eigen::MatrixXd covariance = as_matrix(K, "K");
              if (out.is_none()) {
                  return py::cast(gower_norm(covariance));
              }
              auto target = map_output(out, "out");
              Eigen::MatrixXd scaled(target.rows(), target.cols());
              gower_norm(covariance, scaled);
              target = scaled;
              return py::none();
          },
          py::arg("K"), py::arg("out") = py::none(),
          "Perform Gower rescaling of covariance matrix K.");

    m.def("gower_scale", [](py::object K) { return gower_scale(as_matrix(K, "K")); }, py::arg("K"));

    py::class_<KinshipAccumulator>(m, "KinshipAccumulator")
        .def(py::init<std::size_t, std::size_t>(), py::arg("n_samples"), py::arg("n_features"))
        .def("add", [](KinshipAccumulator& self, py::object block) { self.add(as_matrix(block, "block")); },
             py::arg("block"))
        .def_property_readonly("n_samples", &KinshipAccumulator::n_samples)
        .def_property_readonly("n_features", &KinshipAccumulator::n_features)
        .def_property_readonly("features_seen", &KinshipAccumulator::features_seen)
        .def_property_readonly("complete", &KinshipAccumulator::complete)
        .def_property_readonly("matrix", [](const KinshipAccumulator& self) { return Eigen::MatrixXd(self.matrix()); });
}
