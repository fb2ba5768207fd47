#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "../optimization/composite.h"
#include "../optimization/errors.h"
#include "../optimization/losses.h"
#include "../optimization/multiblock.h"
#include "../optimization/penalty.h"
#include "../optimization/taylor.h"
#include "../optimization/taylor_wrapper.h"

namespace py = pybind11;
using namespace taylix;

// Objective implemented in Python; clones share the Python object
class PythonObjective : public Objective {
public:
    explicit PythonObjective(py::object obj) : obj_(std::move(obj)) {}

    double value(const Eigen::VectorXd& x) const override {
        return obj_.attr("value")(x).cast<double>();
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        return obj_.attr("gradient")(x).cast<Eigen::VectorXd>();
    }

    void reset() override { obj_.attr("reset")(); }

    int dimension() const override { return obj_.attr("dimension")().cast<int>(); }

    double lipschitz_constant() const override {
        return obj_.attr("lipschitz_constant")().cast<double>();
    }

    bool has_lipschitz_constant() const override {
        return obj_.attr("has_lipschitz_constant")().cast<bool>();
    }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<PythonObjective>(obj_);
    }

private:
    py::object obj_;
};

class PythonMultiblockObjective : public MultiblockObjective {
public:
    explicit PythonMultiblockObjective(py::object obj) : obj_(std::move(obj)) {}

    double value(const BlockPoint& w) const override {
        return obj_.attr("value")(w).cast<double>();
    }

    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override {
        return obj_.attr("gradient")(w, index).cast<Eigen::VectorXd>();
    }

    int num_blocks() const override { return obj_.attr("num_blocks")().cast<int>(); }

    void reset() override { obj_.attr("reset")(); }

    double lipschitz_constant(const BlockPoint& w, int index) const override {
        return obj_.attr("lipschitz_constant")(w, index).cast<double>();
    }

    std::unique_ptr<MultiblockObjective> clone() const override {
        return std::make_unique<PythonMultiblockObjective>(obj_);
    }

private:
    py::object obj_;
};

// Trampoline for Objective
class PyObjective : public Objective {
public:
    using Objective::Objective;

    double value(const Eigen::VectorXd& x) const override {
        PYBIND11_OVERRIDE_PURE(double, Objective, value, x);
    }

    Eigen::VectorXd gradient(const Eigen::VectorXd& x) const override {
        PYBIND11_OVERRIDE_PURE(Eigen::VectorXd, Objective, gradient, x);
    }

    void reset() override {
        PYBIND11_OVERRIDE(void, Objective, reset, );
    }

    int dimension() const override {
        PYBIND11_OVERRIDE(int, Objective, dimension, );
    }

    double lipschitz_constant() const override {
        PYBIND11_OVERRIDE(double, Objective, lipschitz_constant, );
    }

    bool has_lipschitz_constant() const override {
        PYBIND11_OVERRIDE(bool, Objective, has_lipschitz_constant, );
    }

    std::unique_ptr<Objective> clone() const override {
        return std::make_unique<PythonObjective>(
            py::cast(static_cast<const Objective*>(this), py::return_value_policy::reference)));
    }
};

// Trampoline for MultiblockObjective
class PyMultiblockObjective : public MultiblockObjective {
public:
    using MultiblockObjective::MultiblockObjective;

    double value(const BlockPoint& w) const override {
        PYBIND11_OVERRIDE_PURE(double, MultiblockObjective, value, w);
    }

    Eigen::VectorXd gradient(const BlockPoint& w, int index) const override {
        PYBIND11_OVERRIDE_PURE(Eigen::VectorXd, MultiblockObjective, gradient, w, index);
    }

    int num_blocks() const override {
        PYBIND11_OVERRIDE(int, MultiblockObjective, num_blocks, );
    }

    double lipschitz_constant(const BlockPoint& w, int index) const override {
        PYBIND11_OVERRIDE(double, MultiblockObjective, lipschitz_constant, w, index);
    }

    void reset() override {
        PYBIND11_OVERRIDE(void, MultiblockObjective, reset, );
    }

    std::unique_ptr<MultiblockObjective> clone() const override {
        return std::make_unique<PythonMultiblockObjective>(
            py::cast(static_cast<const MultiblockObjective*>(this), py::return_value_policy::reference)));
    }
};

namespace {

py::object state_to_python(const TaylorState& state) {
    if (auto* wrapped = std::get_if<TaylorWrapped>(&state)) {
        return py::cast(*wrapped);
    }
    return py::none();
}

py::object state_to_python(const MultiblockTaylorState& state) {
    if (auto* wrapped = std::get_if<MultiblockTaylorWrapped>(&state)) {
        return py::cast(*wrapped);
    }
    return py::none();
}

} // namespace

PYBIND11_MODULE(taylor, m) {
    m.doc() = "Taylix first-order Taylor surrogates";

    py::register_exception<DoubleWrapError>(m, "DoubleWrapError", PyExc_RuntimeError);
    py::register_exception<StructureError>(m, "StructureError", PyExc_ValueError);

    py::class_<TaylorWrapped>(m, "TaylorWrapped")
        .def_readonly("point", &TaylorWrapped::point)
        .def_readonly("value_at_point", &TaylorWrapped::value_at_point)
        .def_readonly("gradient_at_point", &TaylorWrapped::gradient_at_point);

    py::class_<MultiblockTaylorWrapped>(m, "MultiblockTaylorWrapped")
        .def_readonly("point", &MultiblockTaylorWrapped::point)
        .def_readonly("value_at_point", &MultiblockTaylorWrapped::value_at_point)
        .def_readonly("gradient_at_point", &MultiblockTaylorWrapped::gradient_at_point);

    py::class_<TaylorOptions>(m, "TaylorOptions")
        .def(py::init<>())
        .def_readwrite("lipschitz_constant", &TaylorOptions::lipschitz_constant)
        .def("validate", &TaylorOptions::validate);

    // --- Single block ---

    py::class_<Objective, PyObjective, std::shared_ptr<Objective>>(m, "Objective")
        .def(py::init<>())
        .def("value", &Objective::value, py::arg("x"))
        .def("gradient", &Objective::gradient, py::arg("x"))
        .def("reset", &Objective::reset)
        .def("recenter", &Objective::recenter, py::arg("point"))
        .def("lipschitz_constant", &Objective::lipschitz_constant)
        .def("has_lipschitz_constant", &Objective::has_lipschitz_constant)
        .def("dimension", &Objective::dimension)
        .def("clone", [](const Objective& self) {
            return std::shared_ptr<Objective>(self.clone());
        })
        .def("taylor_state", [](const Objective& self) {
            return state_to_python(self.taylor_state());
        }, "None for a plain function, the captured expansion for a surrogate");

    py::class_<CompositeObjective, Objective, std::shared_ptr<CompositeObjective>>(m, "CompositeObjective")
        .def(py::init<CompositeObjective::Entries, CompositeObjective::Entries, CompositeObjective::Entries>(),
             py::arg("losses"),
             py::arg("decoupled_penalties") = CompositeObjective::Entries(),
             py::arg("coupled_penalties") = CompositeObjective::Entries())
        .def_readwrite("losses", &CompositeObjective::losses)
        .def_readwrite("decoupled_penalties", &CompositeObjective::decoupled_penalties)
        .def_readwrite("coupled_penalties", &CompositeObjective::coupled_penalties)
        .def("smooth_value", &CompositeObjective::smooth_value)
        .def("smooth_gradient", &CompositeObjective::smooth_gradient)
        .def("non_smooth_value", &CompositeObjective::non_smooth_value)
        .def("non_smooth_gradient", &CompositeObjective::non_smooth_gradient);

    py::class_<TaylorApproximation, Objective, std::shared_ptr<TaylorApproximation>>(m, "TaylorApproximation")
        .def("point", &TaylorApproximation::point);

    py::class_<FirstOrderTaylorApproximation, TaylorApproximation,
               std::shared_ptr<FirstOrderTaylorApproximation>>(m, "FirstOrderTaylorApproximation")
        .def(py::init<std::shared_ptr<Objective>, Eigen::VectorXd, TaylorOptions>(),
             py::arg("function"), py::arg("point"), py::arg("options") = TaylorOptions())
        .def("function", &FirstOrderTaylorApproximation::function);

    py::class_<LinearizedObjective, TaylorApproximation, std::shared_ptr<LinearizedObjective>>(m, "LinearizedObjective")
        .def("target", &LinearizedObjective::target);

    py::class_<Penalty, Objective, std::shared_ptr<Penalty>>(m, "Penalty")
        .def("prox", &Penalty::prox, py::arg("x"), py::arg("step"))
        .def("is_smooth", &Penalty::is_smooth);

    py::class_<L1Penalty, Penalty, std::shared_ptr<L1Penalty>>(m, "L1Penalty")
        .def(py::init<double>(), py::arg("lam") = 1.0)
        .def_readwrite("lam", &L1Penalty::lambda);

    py::class_<L2Penalty, Penalty, std::shared_ptr<L2Penalty>>(m, "L2Penalty")
        .def(py::init<double>(), py::arg("lam") = 1.0)
        .def_readwrite("lam", &L2Penalty::lambda);

    py::class_<ElasticNetPenalty, Penalty, std::shared_ptr<ElasticNetPenalty>>(m, "ElasticNetPenalty")
        .def(py::init<double, double>(), py::arg("l1") = 1.0, py::arg("l2") = 1.0)
        .def_readwrite("lambda1", &ElasticNetPenalty::lambda1)
        .def_readwrite("lambda2", &ElasticNetPenalty::lambda2);

    m.def("make_penalty", [](const std::string& type, double lam, double l1_ratio) {
        return std::shared_ptr<Penalty>(make_penalty(type, lam, l1_ratio));
    }, py::arg("type"), py::arg("lam") = 1.0, py::arg("l1_ratio") = 1.0);

    py::class_<LeastSquaresObjective, Objective, std::shared_ptr<LeastSquaresObjective>>(m, "LeastSquaresObjective")
        .def(py::init<Eigen::MatrixXd, Eigen::VectorXd>(), py::arg("X"), py::arg("y"))
        .def("value_and_gradient", &LeastSquaresObjective::value_and_gradient);

    // --- Multiblock ---

    py::class_<MultiblockObjective, PyMultiblockObjective, std::shared_ptr<MultiblockObjective>>(m, "MultiblockObjective")
        .def(py::init<>())
        .def("value", &MultiblockObjective::value, py::arg("w"))
        .def("gradient", &MultiblockObjective::gradient, py::arg("w"), py::arg("index"))
        .def("num_blocks", &MultiblockObjective::num_blocks)
        .def("reset", &MultiblockObjective::reset)
        .def("recenter", &MultiblockObjective::recenter, py::arg("points"))
        .def("lipschitz_constant", &MultiblockObjective::lipschitz_constant,
             py::arg("w"), py::arg("index"))
        .def("clone", [](const MultiblockObjective& self) {
            return std::shared_ptr<MultiblockObjective>(self.clone());
        })
        .def("taylor_state", [](const MultiblockObjective& self) {
            return state_to_python(self.taylor_state());
        });

    py::class_<MultiblockCompositeObjective, MultiblockObjective,
               std::shared_ptr<MultiblockCompositeObjective>>(m, "MultiblockCompositeObjective")
        .def(py::init<int>(), py::arg("n_blocks"))
        .def_readwrite("losses", &MultiblockCompositeObjective::losses)
        .def_readwrite("decoupled_penalties", &MultiblockCompositeObjective::decoupled_penalties)
        .def_readwrite("coupled_penalties", &MultiblockCompositeObjective::coupled_penalties)
        .def("add_loss", &MultiblockCompositeObjective::add_loss,
             py::arg("i"), py::arg("j"), py::arg("loss"))
        .def("add_decoupled_penalty", &MultiblockCompositeObjective::add_decoupled_penalty,
             py::arg("i"), py::arg("penalty"))
        .def("add_coupled_penalty", &MultiblockCompositeObjective::add_coupled_penalty,
             py::arg("i"), py::arg("penalty"))
        .def("smooth_value", &MultiblockCompositeObjective::smooth_value)
        .def("smooth_gradient", &MultiblockCompositeObjective::smooth_gradient)
        .def("non_smooth_value", &MultiblockCompositeObjective::non_smooth_value)
        .def("non_smooth_gradient", &MultiblockCompositeObjective::non_smooth_gradient)
        .def("validate", &MultiblockCompositeObjective::validate, py::arg("points"));

    py::class_<MultiblockTaylorApproximation, MultiblockObjective,
               std::shared_ptr<MultiblockTaylorApproximation>>(m, "MultiblockTaylorApproximation")
        .def("point", &MultiblockTaylorApproximation::point)
        .def("block_indices", &MultiblockTaylorApproximation::block_indices);

    py::class_<MultiblockFirstOrderTaylorApproximation, MultiblockTaylorApproximation,
               std::shared_ptr<MultiblockFirstOrderTaylorApproximation>>(m, "MultiblockFirstOrderTaylorApproximation")
        .def(py::init<std::shared_ptr<MultiblockObjective>, BlockPoint, std::vector<int>, TaylorOptions>(),
             py::arg("function"), py::arg("point"), py::arg("block_indices"),
             py::arg("options") = TaylorOptions())
        .def("local_point", &MultiblockFirstOrderTaylorApproximation::local_point);

    py::class_<MultiblockLinearizedObjective, MultiblockTaylorApproximation,
               std::shared_ptr<MultiblockLinearizedObjective>>(m, "MultiblockLinearizedObjective")
        .def("target", &MultiblockLinearizedObjective::target);

    py::class_<CrossCovarianceLoss, MultiblockObjective, std::shared_ptr<CrossCovarianceLoss>>(m, "CrossCovarianceLoss")
        .def(py::init<Eigen::MatrixXd, Eigen::MatrixXd>(), py::arg("X1"), py::arg("X2"));

    // --- Engine ---

    py::class_<FirstOrderTaylorWrapper>(m, "FirstOrderTaylorWrapper")
        .def(py::init([](double lipschitz_constant, bool verbose) {
            FirstOrderTaylorWrapper w;
            w.lipschitz_constant = lipschitz_constant;
            w.verbose = verbose;
            return w;
        }), py::arg("lipschitz_constant") = consts::taylor_lipschitz(), py::arg("verbose") = false)
        .def_readwrite("lipschitz_constant", &FirstOrderTaylorWrapper::lipschitz_constant)
        .def_readwrite("verbose", &FirstOrderTaylorWrapper::verbose)
        .def("__call__", [](const FirstOrderTaylorWrapper& self, const Objective& f, const Eigen::VectorXd& point) {
            return std::shared_ptr<Objective>(self(f, point));
        }, py::arg("function"), py::arg("point"))
        .def("__call__", [](const FirstOrderTaylorWrapper& self, const MultiblockObjective& f, const BlockPoint& points) {
            return std::shared_ptr<MultiblockObjective>(self(f, points));
        }, py::arg("function"), py::arg("points"))
        .def_static("wrap", [](std::shared_ptr<Objective> f, const Eigen::VectorXd& point, const TaylorOptions& options) {
            return std::shared_ptr<LinearizedObjective>(
                FirstOrderTaylorWrapper::wrap(std::move(f), point, options));
        }, py::arg("function"), py::arg("point"), py::arg("options") = TaylorOptions())
        .def_static("wrap_multiblock", [](std::shared_ptr<MultiblockObjective> f, const BlockPoint& points,
                                          std::vector<int> block_indices, const TaylorOptions& options) {
            return std::shared_ptr<MultiblockLinearizedObjective>(
                FirstOrderTaylorWrapper::wrap_multiblock(std::move(f), points, std::move(block_indices), options));
        }, py::arg("function"), py::arg("points"), py::arg("block_indices"),
           py::arg("options") = TaylorOptions());
}
