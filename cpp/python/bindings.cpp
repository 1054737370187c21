#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <memory>
#include <string>
#include <vector>

#include "udmis/udmis.hpp"

namespace py = pybind11;

namespace {

// (n, 2) float array -> point sequence
std::vector<udmis::Vec2> points_from_array(
    const py::array_t<double, py::array::c_style | py::array::forcecast>& arr
) {
    if (arr.ndim() != 2 || arr.shape(1) != 2) {
        throw py::value_error("points must have shape (n, 2)");
    }
    auto buf = arr.unchecked<2>();
    std::vector<udmis::Vec2> points;
    points.reserve(static_cast<size_t>(buf.shape(0)));
    for (py::ssize_t i = 0; i < buf.shape(0); ++i) {
        points.emplace_back(buf(i, 0), buf(i, 1));
    }
    return points;
}

py::array_t<bool> config_to_array(const udmis::Configuration& config) {
    py::array_t<bool> arr(static_cast<py::ssize_t>(config.size()));
    auto buf = arr.mutable_unchecked<1>();
    for (size_t i = 0; i < config.size(); ++i) {
        buf(static_cast<py::ssize_t>(i)) = config[static_cast<udmis::Index>(i)];
    }
    return arr;
}

udmis::HamiltonianPtr clone_hamiltonian(
    const std::shared_ptr<udmis::Hamiltonian>& hamiltonian
) {
    if (!hamiltonian) {
        throw py::value_error("Hamiltonian is null");
    }
    return hamiltonian->clone();
}

py::array_t<double> trace_to_array(const std::vector<udmis::EnergySample>& trace) {
    py::array_t<double> arr({static_cast<py::ssize_t>(trace.size()), static_cast<py::ssize_t>(3)});
    auto buf = arr.mutable_unchecked<2>();
    for (size_t k = 0; k < trace.size(); ++k) {
        auto row = static_cast<py::ssize_t>(k);
        buf(row, 0) = static_cast<double>(trace[k].step);
        buf(row, 1) = trace[k].temperature;
        buf(row, 2) = trace[k].energy;
    }
    return arr;
}

}  // namespace

PYBIND11_MODULE(udmis_cpp, m) {
    m.doc() = "Simulated annealing for unit-disk maximum independent set";

    py::register_exception<udmis::InvalidInputError>(m, "InvalidInputError", PyExc_ValueError);

    // Vec2
    py::class_<udmis::Vec2>(m, "Vec2")
        .def(py::init<>())
        .def(py::init<double, double>())
        .def_readwrite("x", &udmis::Vec2::x)
        .def_readwrite("y", &udmis::Vec2::y)
        .def("distance", &udmis::Vec2::distance)
        .def("__repr__", [](const udmis::Vec2& v) {
            return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
        });

    // UnitDiskGraph
    py::class_<udmis::UnitDiskGraph, std::shared_ptr<udmis::UnitDiskGraph>>(m, "UnitDiskGraph")
        .def(py::init([](const py::array_t<double, py::array::c_style | py::array::forcecast>& points,
                         double radius, bool gridded) {
            auto pts = points_from_array(points);
            return std::make_shared<udmis::UnitDiskGraph>(
                gridded ? udmis::build_edges_grid(pts, radius) : udmis::build_edges(pts, radius)
            );
        }), py::arg("points"), py::arg("radius") = udmis::UNIT_DISK_RADIUS, py::arg("gridded") = false)
        .def("size", &udmis::UnitDiskGraph::size)
        .def("num_edges", &udmis::UnitDiskGraph::num_edges)
        .def("radius", &udmis::UnitDiskGraph::radius)
        .def("adjacent", &udmis::UnitDiskGraph::adjacent)
        .def("degree", [](const udmis::UnitDiskGraph& self, udmis::Index i) {
            self.check_index(i);
            return self.degree(i);
        })
        .def("neighbors", [](const udmis::UnitDiskGraph& self, udmis::Index i) {
            self.check_index(i);
            auto nbrs = self.neighbors(i);
            return std::vector<udmis::Index>(nbrs.begin(), nbrs.end());
        })
        .def("edges", &udmis::UnitDiskGraph::edges)
        .def("points", [](const udmis::UnitDiskGraph& self) {
            py::ssize_t n = static_cast<py::ssize_t>(self.size());
            py::array_t<double> arr({n, static_cast<py::ssize_t>(2)});
            auto buf = arr.mutable_unchecked<2>();
            for (py::ssize_t i = 0; i < n; ++i) {
                const auto& p = self.points()[static_cast<size_t>(i)];
                buf(i, 0) = p.x;
                buf(i, 1) = p.y;
            }
            return arr;
        });

    // BitOrder
    py::enum_<udmis::BitOrder>(m, "BitOrder")
        .value("VertexOrder", udmis::BitOrder::VertexOrder)
        .value("Reversed", udmis::BitOrder::Reversed);

    // Configuration
    py::class_<udmis::Configuration>(m, "Configuration")
        .def(py::init<>())
        .def(py::init<size_t, bool>(), py::arg("n"), py::arg("occupied") = false)
        .def(py::init<const std::vector<bool>&>())
        .def_static("from_bitstring", &udmis::Configuration::from_bitstring,
            py::arg("bits"), py::arg("order") = udmis::BitOrder::VertexOrder)
        .def("to_bitstring", &udmis::Configuration::to_bitstring,
            py::arg("order") = udmis::BitOrder::VertexOrder)
        .def("size", &udmis::Configuration::size)
        .def("occupied", &udmis::Configuration::occupied)
        .def("set", &udmis::Configuration::set)
        .def("flip", &udmis::Configuration::flip)
        .def("count_occupied", &udmis::Configuration::count_occupied)
        .def("occupied_vertices", &udmis::Configuration::occupied_vertices)
        .def("to_numpy", &config_to_array)
        .def("__len__", &udmis::Configuration::size)
        .def("__eq__", &udmis::Configuration::operator==);

    m.def("count_violations", &udmis::count_violations);
    m.def("is_independent_set", &udmis::is_independent_set);
    m.def("repair_independent_set", [](const udmis::UnitDiskGraph& graph, const udmis::Configuration& config) {
        udmis::Configuration out = config;
        int removed = udmis::repair_independent_set(graph, out);
        return py::make_tuple(out, removed);
    });

    // Energy models
    py::class_<udmis::Hamiltonian, std::shared_ptr<udmis::Hamiltonian>>(m, "Hamiltonian")
        .def("total_energy", &udmis::Hamiltonian::total_energy)
        .def("energy_delta", &udmis::Hamiltonian::energy_delta);

    py::class_<udmis::UDMISHamiltonian, udmis::Hamiltonian, std::shared_ptr<udmis::UDMISHamiltonian>>(m, "UDMISHamiltonian")
        .def(py::init<double>(), py::arg("u"))
        .def("u", &udmis::UDMISHamiltonian::u);

    // RNG
    py::class_<udmis::RNG>(m, "RNG")
        .def(py::init<>())
        .def(py::init<uint64_t>())
        .def("uniform", py::overload_cast<>(&udmis::RNG::uniform))
        .def("uniform", py::overload_cast<double, double>(&udmis::RNG::uniform))
        .def("randint", &udmis::RNG::randint)
        .def("split", &udmis::RNG::split);

    // AnnealingEngine
    py::class_<udmis::AnnealingEngine>(m, "AnnealingEngine")
        .def(py::init([](double u,
                         const py::array_t<double, py::array::c_style | py::array::forcecast>& points,
                         double radius, uint64_t seed, bool verbose) {
            auto pts = points_from_array(points);
            return udmis::AnnealingEngine(u, pts, radius, seed, verbose);
        }), py::arg("u"), py::arg("points"), py::arg("radius") = udmis::UNIT_DISK_RADIUS,
            py::arg("seed") = 42, py::arg("verbose") = false)
        .def(py::init([](const std::shared_ptr<udmis::UnitDiskGraph>& graph,
                         const std::shared_ptr<udmis::Hamiltonian>& hamiltonian,
                         uint64_t seed, bool verbose) {
            return udmis::AnnealingEngine(graph, clone_hamiltonian(hamiltonian), seed, verbose);
        }), py::arg("graph"), py::arg("hamiltonian"), py::arg("seed") = 42, py::arg("verbose") = false)
        .def("total_energy", &udmis::AnnealingEngine::total_energy)
        .def("energy", &udmis::AnnealingEngine::energy)
        .def("energy_delta", &udmis::AnnealingEngine::energy_delta)
        .def("random_vertex", &udmis::AnnealingEngine::random_vertex)
        .def("metropolis_step", &udmis::AnnealingEngine::metropolis_step, py::arg("temperature"))
        .def("flip", &udmis::AnnealingEngine::flip)
        .def("set_configuration", &udmis::AnnealingEngine::set_configuration)
        .def("randomize", &udmis::AnnealingEngine::randomize)
        .def("resync_energy", &udmis::AnnealingEngine::resync_energy)
        .def("configuration", &udmis::AnnealingEngine::configuration)
        .def("occupation", [](const udmis::AnnealingEngine& self) {
            return config_to_array(self.configuration());
        })
        .def("size", &udmis::AnnealingEngine::size)
        .def("violations", &udmis::AnnealingEngine::violations)
        .def("occupied_count", &udmis::AnnealingEngine::occupied_count)
        .def("is_independent_set", &udmis::AnnealingEngine::is_independent_set)
        .def("accept_rate", &udmis::AnnealingEngine::accept_rate)
        .def("accepted_count", &udmis::AnnealingEngine::accepted_count)
        .def("rejected_count", &udmis::AnnealingEngine::rejected_count)
        .def("steps", &udmis::AnnealingEngine::steps)
        .def("last_accept", &udmis::AnnealingEngine::last_accept)
        .def("last_delta", &udmis::AnnealingEngine::last_delta)
        .def("set_verbose", &udmis::AnnealingEngine::set_verbose);

    // Schedules
    py::enum_<udmis::CoolingSchedule>(m, "CoolingSchedule")
        .value("Exponential", udmis::CoolingSchedule::Exponential)
        .value("Linear", udmis::CoolingSchedule::Linear)
        .value("Logarithmic", udmis::CoolingSchedule::Logarithmic);

    m.def("geometric_schedule", &udmis::geometric_schedule,
        py::arg("t_initial"), py::arg("t_final"), py::arg("n"));
    m.def("linear_schedule", &udmis::linear_schedule,
        py::arg("t_initial"), py::arg("t_final"), py::arg("n"));
    m.def("logarithmic_schedule", &udmis::logarithmic_schedule,
        py::arg("t_initial"), py::arg("t_final"), py::arg("n"));
    m.def("make_schedule", &udmis::make_schedule,
        py::arg("schedule"), py::arg("t_initial"), py::arg("t_final"), py::arg("n"));

    // Driver
    py::class_<udmis::AnnealOptions>(m, "AnnealOptions")
        .def(py::init<>())
        .def_readwrite("sample_every", &udmis::AnnealOptions::sample_every)
        .def_readwrite("record_configurations", &udmis::AnnealOptions::record_configurations)
        .def_readwrite("verbose", &udmis::AnnealOptions::verbose);

    py::class_<udmis::AnnealResult>(m, "AnnealResult")
        .def_readonly("final_configuration", &udmis::AnnealResult::final_configuration)
        .def_readonly("final_energy", &udmis::AnnealResult::final_energy)
        .def_readonly("best_configuration", &udmis::AnnealResult::best_configuration)
        .def_readonly("best_energy", &udmis::AnnealResult::best_energy)
        .def_readonly("snapshots", &udmis::AnnealResult::snapshots)
        .def_readonly("accepted", &udmis::AnnealResult::accepted)
        .def_readonly("rejected", &udmis::AnnealResult::rejected)
        .def("trace", [](const udmis::AnnealResult& self) {
            return trace_to_array(self.trace);
        });

    m.def("anneal", [](udmis::AnnealingEngine& engine,
                       const std::vector<double>& temperatures,
                       const udmis::AnnealOptions& options) {
        py::gil_scoped_release release;
        return udmis::anneal(engine, temperatures, options);
    }, py::arg("engine"), py::arg("temperatures"), py::arg("options") = udmis::AnnealOptions{});

    m.def("anneal_restarts", [](const std::shared_ptr<udmis::UnitDiskGraph>& graph,
                                const udmis::Hamiltonian& hamiltonian,
                                const std::vector<double>& temperatures,
                                int n_restarts, uint64_t seed,
                                const udmis::AnnealOptions& options) {
        udmis::RestartsResult result;
        {
            py::gil_scoped_release release;
            result = udmis::anneal_restarts(graph, hamiltonian, temperatures, n_restarts, seed, options);
        }
        return py::make_tuple(result.runs, result.best_index);
    }, py::arg("graph"), py::arg("hamiltonian"), py::arg("temperatures"), py::arg("n_restarts"),
       py::arg("seed") = 42, py::arg("options") = udmis::AnnealOptions{});
}
