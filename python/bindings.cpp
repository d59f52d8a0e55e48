/**
 * SPNLearn Python Bindings
 *
 * Provides an sklearn-like estimator around learn_parametric.
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <sstream>

#include "spnlearn/spnlearn.hpp"

namespace py = pybind11;
using namespace spnlearn;

// ============================================================================
// NumPy Conversion Utilities
// ============================================================================

namespace {

Dataset dataset_from_numpy(const py::array_t<float, py::array::c_style | py::array::forcecast>& X) {
    auto buf = X.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("X must be 2-dimensional");
    }

    Dataset data;
    data.from_dense(static_cast<const float*>(buf.ptr),
                    static_cast<Index>(buf.shape[0]),
                    static_cast<Index>(buf.shape[1]));
    return data;
}

} // namespace

// ============================================================================
// Python Estimator Class
// ============================================================================

class SumProductNetwork {
public:
    SumProductNetwork(
        int min_instances_slice = 200,
        bool cluster_first = true,
        bool cluster_univariate = false,
        int n_clusters = 2,
        int max_iterations = 100,
        float threshold = 0.3f,
        int max_discrete_values = 20,
        double alpha = 1.0,
        int seed = 42,
        int verbosity = 1
    ) {
        config_.structure.min_instances_slice = min_instances_slice;
        config_.structure.cluster_first = cluster_first;
        config_.structure.cluster_univariate = cluster_univariate;
        config_.clustering.n_clusters = n_clusters;
        config_.clustering.max_iterations = max_iterations;
        config_.independence.threshold = threshold;
        config_.context.max_discrete_values = max_discrete_values;
        config_.leaf.alpha = alpha;
        config_.seed = seed;
        config_.verbosity = verbosity;
    }

    SumProductNetwork& fit(py::array_t<float, py::array::c_style | py::array::forcecast> X) {
        Dataset data = dataset_from_numpy(X);
        n_variables_ = data.n_cols();

        // Release the GIL during learning
        {
            py::gil_scoped_release release;
            spn_ = learn_parametric(data, config_);
        }
        return *this;
    }

    py::array_t<double> log_likelihood(py::array_t<float, py::array::c_style | py::array::forcecast> X) const {
        ensure_fitted();
        Dataset data = dataset_from_numpy(X);
        if (data.n_cols() != n_variables_) {
            throw std::runtime_error("X has " + std::to_string(data.n_cols()) +
                                     " columns, model was fitted on " + std::to_string(n_variables_));
        }

        std::vector<Double> ll;
        {
            py::gil_scoped_release release;
            ll = spnlearn::log_likelihood(*spn_, data);
        }

        auto result = py::array_t<double>(ll.size());
        auto r = result.mutable_unchecked<1>();
        for (size_t i = 0; i < ll.size(); ++i) {
            r(i) = ll[i];
        }
        return result;
    }

    size_t n_nodes() const {
        ensure_fitted();
        return count_nodes(*spn_).total();
    }

    size_t n_leaves() const {
        ensure_fitted();
        return count_nodes(*spn_).leaf;
    }

    uint32_t depth() const {
        ensure_fitted();
        return spnlearn::depth(*spn_);
    }

    std::string to_string() const {
        if (!spn_) {
            return "SumProductNetwork(not fitted)";
        }
        std::ostringstream out;
        print(*spn_, out);
        return out.str();
    }

private:
    Config config_;
    std::unique_ptr<Node> spn_;
    Index n_variables_ = 0;

    void ensure_fitted() const {
        if (!spn_) {
            throw std::runtime_error("Model not fitted. Call fit() first.");
        }
    }
};

// ============================================================================
// Module Definition
// ============================================================================

PYBIND11_MODULE(_spnlearn, m) {
    m.doc() = "SPNLearn: Sum-Product Network Structure Learning";

    // Version info
    m.attr("__version__") = SPNLEARN_VERSION_STRING;

    py::class_<SumProductNetwork>(m, "SumProductNetwork")
        .def(py::init<int, bool, bool, int, int, float, int, double, int, int>(),
             py::arg("min_instances_slice") = 200,
             py::arg("cluster_first") = true,
             py::arg("cluster_univariate") = false,
             py::arg("n_clusters") = 2,
             py::arg("max_iterations") = 100,
             py::arg("threshold") = 0.3f,
             py::arg("max_discrete_values") = 20,
             py::arg("alpha") = 1.0,
             py::arg("seed") = 42,
             py::arg("verbosity") = 1)
        .def("fit", &SumProductNetwork::fit, py::arg("X"), py::return_value_policy::reference)
        .def("log_likelihood", &SumProductNetwork::log_likelihood, py::arg("X"))
        .def_property_readonly("n_nodes", &SumProductNetwork::n_nodes)
        .def_property_readonly("n_leaves", &SumProductNetwork::n_leaves)
        .def_property_readonly("depth", &SumProductNetwork::depth)
        .def("__str__", &SumProductNetwork::to_string);

    m.def("print_info", &print_info, "Print SPNLearn library information");
}
