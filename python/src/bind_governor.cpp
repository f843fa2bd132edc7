#include "bind_forward.hpp"
#include <roundabout/roundabout.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace roundabout;

// ---------------------------------------------------------------------------
// Wrapper for std::future<ApprovalResponse>
// ---------------------------------------------------------------------------
struct FutureApproval {
    std::future<ApprovalResponse> fut;

    ApprovalResponse result() {
        py::gil_scoped_release release;
        return fut.get();
    }

    bool ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
};

// ---------------------------------------------------------------------------
// bind_governor  --  approval records, FutureApproval, ResourceGovernor
// ---------------------------------------------------------------------------
void bind_governor(py::module_& m) {

    // ===================================================================
    // Approval records
    // ===================================================================
    py::class_<AgentRegistration>(m, "AgentRegistration")
        .def(py::init<>())
        .def_readwrite("agent_id",        &AgentRegistration::agent_id)
        .def_readwrite("parent_id",       &AgentRegistration::parent_id)
        .def_readwrite("root_id",         &AgentRegistration::root_id)
        .def_readwrite("user_id",         &AgentRegistration::user_id)
        .def_readwrite("budget",          &AgentRegistration::budget)
        .def_readwrite("recursion_depth", &AgentRegistration::recursion_depth)
        .def_readwrite("thread_id",       &AgentRegistration::thread_id);

    py::class_<ApprovalRequest>(m, "ApprovalRequest")
        .def(py::init<>())
        .def_readwrite("operation",           &ApprovalRequest::operation)
        .def_readwrite("requesting_agent_id", &ApprovalRequest::requesting_agent_id)
        .def_readwrite("estimated_cost",      &ApprovalRequest::estimated_cost)
        .def_readwrite("thread",              &ApprovalRequest::thread);

    py::class_<ApprovalResponse>(m, "ApprovalResponse")
        .def(py::init<>())
        .def_readwrite("approved",       &ApprovalResponse::approved)
        .def_readwrite("reason",         &ApprovalResponse::reason)
        .def_readwrite("denial",         &ApprovalResponse::denial)
        .def_readwrite("violations",     &ApprovalResponse::violations)
        .def_readwrite("updated_budget", &ApprovalResponse::updated_budget)
        .def_readwrite("approved_cost",  &ApprovalResponse::approved_cost)
        .def("__bool__", [](const ApprovalResponse& r) { return r.approved; })
        .def("__repr__", [](const ApprovalResponse& r) {
            return std::string("<ApprovalResponse ") + (r.approved ? "approved" : "denied") +
                   " reason='" + r.reason + "'>";
        });

    py::class_<SystemStatus>(m, "SystemStatus")
        .def(py::init<>())
        .def_readwrite("active_agents",  &SystemStatus::active_agents)
        .def_readwrite("total_usage",    &SystemStatus::total_usage)
        .def_readwrite("breaker_status", &SystemStatus::breaker_status);

    // ===================================================================
    // FutureApproval
    // ===================================================================
    py::class_<FutureApproval>(m, "FutureApproval")
        .def("result", &FutureApproval::result,
             "Block until the decision is available (releases the GIL while waiting).")
        .def("ready",  &FutureApproval::ready,
             "Return True if the decision is available without blocking.");

    // ===================================================================
    // ResourceGovernor
    // ===================================================================
    py::class_<ResourceGovernor, std::shared_ptr<ResourceGovernor>>(m, "ResourceGovernor")
        .def(py::init<Config, std::shared_ptr<Clock>, std::shared_ptr<Monitor>>(),
             py::arg("config") = Config{}, py::arg("clock") = nullptr,
             py::arg("monitor") = nullptr)

        // ------------- Registry -------------
        .def("register_agent",         &ResourceGovernor::register_agent,
             py::arg("registration"))
        .def("registration",           &ResourceGovernor::registration,
             py::arg("agent_id"))
        .def("registered_agent_count", &ResourceGovernor::registered_agent_count)
        .def("active_agent_count",     &ResourceGovernor::active_agent_count)

        // ------------- Admission -------------
        .def("request_approval", &ResourceGovernor::request_approval,
             py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("request_approval_async",
             [](ResourceGovernor& self, ApprovalRequest request) {
                 return FutureApproval{self.request_approval_async(std::move(request))};
             },
             py::arg("request"))

        // ------------- Accounting -------------
        .def("update_resource_usage", &ResourceGovernor::update_resource_usage,
             py::arg("agent_id"), py::arg("delta"),
             py::call_guard<py::gil_scoped_release>())
        .def("agent_usage",           &ResourceGovernor::agent_usage,
             py::arg("agent_id"))
        .def("check_resource_limits", &ResourceGovernor::check_resource_limits,
             py::arg("agent_id"), py::arg("thread"))
        .def("record_error",          &ResourceGovernor::record_error,
             py::arg("agent_id"), py::arg("error"),
             py::call_guard<py::gil_scoped_release>())
        .def("remove_agent",          &ResourceGovernor::remove_agent,
             py::arg("agent_id"))
        .def("release_clone_reservation", &ResourceGovernor::release_clone_reservation,
             py::arg("thread_id"))

        // ------------- User quotas -------------
        .def("set_user_quotas",   &ResourceGovernor::set_user_quotas,
             py::arg("user_id"), py::arg("quotas"))
        .def("user_quotas",       &ResourceGovernor::user_quotas,
             py::arg("user_id"))
        .def("set_user_tier",     &ResourceGovernor::set_user_tier,
             py::arg("user_id"), py::arg("tier"))
        .def("check_user_quotas", &ResourceGovernor::check_user_quotas,
             py::arg("user_id"))

        // ------------- Hierarchies -------------
        .def("pause_agent_hierarchy",  &ResourceGovernor::pause_agent_hierarchy,
             py::arg("root_id"), py::arg("reason"))
        .def("resume_agent_hierarchy", &ResourceGovernor::resume_agent_hierarchy,
             py::arg("root_id"))
        .def("is_hierarchy_paused",    &ResourceGovernor::is_hierarchy_paused,
             py::arg("agent_id"))
        .def("paused_hierarchies",     &ResourceGovernor::paused_hierarchies)
        .def("root_of",                &ResourceGovernor::root_of,
             py::arg("agent_id"))

        // ------------- Breaker / tempo -------------
        .def("set_system_tempo",          &ResourceGovernor::set_system_tempo,
             py::arg("tempo"))
        .def("system_tempo",              &ResourceGovernor::system_tempo)
        .def("set_circuit_breaker_state", &ResourceGovernor::set_circuit_breaker_state,
             py::arg("status"))
        .def("circuit_breaker_status",    &ResourceGovernor::circuit_breaker_status)

        // ------------- Queries -------------
        .def("system_status",    &ResourceGovernor::system_status)
        .def("system_metrics",   &ResourceGovernor::system_metrics)
        .def("publish_snapshot", &ResourceGovernor::publish_snapshot)
        .def("config",           &ResourceGovernor::config)
        .def("clock",            &ResourceGovernor::clock);
}
