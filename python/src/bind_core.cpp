#include "bind_forward.hpp"
#include <roundabout/roundabout.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace roundabout;

// Trampoline class to allow Python subclassing of RandomSource
class PyRandomSource : public RandomSource {
public:
    using RandomSource::RandomSource;

    double next_unit() override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(double, RandomSource, next_unit);
    }
};

// ---------------------------------------------------------------------------
// bind_core  --  clocks, randomness, ids, context threads, ADAPT helpers
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Clocks
    // ===================================================================
    py::class_<Clock, std::shared_ptr<Clock>>(m, "Clock")
        .def("now", &Clock::now)
        .def("cancel", &Clock::cancel, py::arg("timer_id"));

    py::class_<SystemClock, Clock, std::shared_ptr<SystemClock>>(m, "SystemClock")
        .def(py::init<>())
        .def("pending_timers", &SystemClock::pending_timers);

    py::class_<ManualClock, Clock, std::shared_ptr<ManualClock>>(m, "ManualClock")
        .def(py::init<>())
        .def(py::init<Timestamp>(), py::arg("start"))
        .def("advance", &ManualClock::advance, py::arg("delta"),
             "Move time forward, running due timers on the calling thread.")
        .def("set", &ManualClock::set, py::arg("t"))
        .def("pending_timers", &ManualClock::pending_timers)
        .def("__repr__", [](const ManualClock& c) {
            return "<ManualClock now=" + std::to_string(to_millis(c.now().time_since_epoch())) +
                   "ms>";
        });

    // ===================================================================
    // Randomness
    // ===================================================================
    py::class_<RandomSource, PyRandomSource, std::shared_ptr<RandomSource>>(m, "RandomSource")
        .def(py::init<>())
        .def("next_unit", &RandomSource::next_unit);

    py::class_<SeededRandomSource, RandomSource, std::shared_ptr<SeededRandomSource>>(
        m, "SeededRandomSource")
        .def(py::init<std::uint64_t>(), py::arg("seed") = 0x5eed);

    // ===================================================================
    // Ids
    // ===================================================================
    py::class_<IdGenerator, std::shared_ptr<IdGenerator>>(m, "IdGenerator")
        .def(py::init<std::string>(), py::arg("prefix") = std::string{})
        .def("next", &IdGenerator::next, py::arg("kind"));

    // ===================================================================
    // Profiles and context threads
    // ===================================================================
    py::class_<ConfigurationProfile>(m, "ConfigurationProfile")
        .def(py::init<>())
        .def(py::init([](std::string user) {
                 ConfigurationProfile p;
                 p.memory_scope = "user:" + user;
                 return p;
             }),
             py::arg("user"),
             "Profile scoped to one user's memory.")
        .def_readwrite("llm_model",           &ConfigurationProfile::llm_model)
        .def_readwrite("toolkit",             &ConfigurationProfile::toolkit)
        .def_readwrite("memory_scope",        &ConfigurationProfile::memory_scope)
        .def_readwrite("entry_phase",         &ConfigurationProfile::entry_phase)
        .def_readwrite("max_recursion_depth", &ConfigurationProfile::max_recursion_depth)
        .def_readwrite("resource_budget",     &ConfigurationProfile::resource_budget);

    py::class_<ContextThread>(m, "ContextThread")
        .def(py::init<>())
        .def_readwrite("id",              &ContextThread::id)
        .def_readwrite("top_level_goal",  &ContextThread::top_level_goal)
        .def_readwrite("parent_agent_id", &ContextThread::parent_agent_id)
        .def_readwrite("task_definition", &ContextThread::task_definition)
        .def_readwrite("profile",         &ContextThread::profile)
        .def_readwrite("memory_scope",    &ContextThread::memory_scope)
        .def_readwrite("budget",          &ContextThread::budget)
        .def_readwrite("recursion_depth", &ContextThread::recursion_depth)
        .def_readwrite("created_at",      &ContextThread::created_at)
        .def_readwrite("updated_at",      &ContextThread::updated_at)
        .def("__repr__", [](const ContextThread& t) {
            return "<ContextThread id='" + t.id + "' depth=" +
                   std::to_string(t.recursion_depth) + " task='" + t.task_definition + "'>";
        });

    m.def("derive_child_budget", &derive_child_budget,
          py::arg("parent_budget"), py::arg("parent_usage"), py::arg("ratio") = 0.3);
    m.def("user_from_memory_scope", &user_from_memory_scope, py::arg("memory_scope"));

    // ===================================================================
    // ADAPT / INTEGRATE helpers
    // ===================================================================
    py::class_<FailureAnalysis>(m, "FailureAnalysis")
        .def(py::init<>())
        .def_readwrite("severity",       &FailureAnalysis::severity)
        .def_readwrite("type",           &FailureAnalysis::type)
        .def_readwrite("pattern",        &FailureAnalysis::pattern)
        .def_readwrite("recommendation", &FailureAnalysis::recommendation);

    m.def("analyze_failures",        &analyze_failures,        py::arg("failures"));
    m.def("make_strategic_decision", &make_strategic_decision, py::arg("factors"));
    m.def("select_approach",         &select_approach,         py::arg("failures"));
    m.def("plan_confidence",         &plan_confidence,
          py::arg("approach"), py::arg("failure_count"));
    m.def("success_probability",     &success_probability,
          py::arg("failure_count"), py::arg("resources_remaining"));
}
