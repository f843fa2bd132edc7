#include "bind_forward.hpp"
#include <roundabout/roundabout.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace roundabout;

// Trampoline class to allow Python subclassing of ModelProvider
class PyModelProvider : public ModelProvider {
public:
    using ModelProvider::ModelProvider;

    ModelResponse chat(const ModelRequest& request) override {
        py::gil_scoped_acquire acquire;
        PYBIND11_OVERRIDE_PURE(ModelResponse, ModelProvider, chat, request);
    }
};

// ---------------------------------------------------------------------------
// bind_agents  --  model boundary, reports, CognitiveAgent, AgentFactory
// ---------------------------------------------------------------------------
void bind_agents(py::module_& m) {

    // ===================================================================
    // Model provider boundary
    // ===================================================================
    py::class_<ModelMessage>(m, "ModelMessage")
        .def(py::init<>())
        .def_readwrite("role",    &ModelMessage::role)
        .def_readwrite("content", &ModelMessage::content);

    py::class_<ModelRequest>(m, "ModelRequest")
        .def(py::init<>())
        .def_readwrite("messages",      &ModelRequest::messages)
        .def_readwrite("max_tokens",    &ModelRequest::max_tokens)
        .def_readwrite("temperature",   &ModelRequest::temperature)
        .def_readwrite("provider_hint", &ModelRequest::provider_hint)
        .def_readwrite("deadline",      &ModelRequest::deadline);

    py::class_<ModelResponse>(m, "ModelResponse")
        .def(py::init<>())
        .def(py::init([](std::string content) { return ModelResponse{std::move(content)}; }),
             py::arg("content"))
        .def_readwrite("content", &ModelResponse::content);

    py::class_<ModelProvider, PyModelProvider, std::shared_ptr<ModelProvider>>(m, "ModelProvider")
        .def(py::init<>())
        .def("chat", &ModelProvider::chat, py::arg("request"));

    // ===================================================================
    // Reports
    // ===================================================================
    py::class_<AgentStatus>(m, "AgentStatus")
        .def(py::init<>())
        .def_readwrite("id",             &AgentStatus::id)
        .def_readwrite("phase",          &AgentStatus::phase)
        .def_readwrite("active",         &AgentStatus::active)
        .def_readwrite("child_count",    &AgentStatus::child_count)
        .def_readwrite("resource_usage", &AgentStatus::resource_usage)
        .def_readwrite("last_activity",  &AgentStatus::last_activity);

    py::class_<ChildAgentReport>(m, "ChildAgentReport")
        .def(py::init<>())
        .def_readwrite("child_id",        &ChildAgentReport::child_id)
        .def_readwrite("task_definition", &ChildAgentReport::task_definition)
        .def_readwrite("status",          &ChildAgentReport::status)
        .def_readwrite("result",          &ChildAgentReport::result)
        .def_readwrite("error",           &ChildAgentReport::error)
        .def_readwrite("resource_usage",  &ChildAgentReport::resource_usage)
        .def_readwrite("execution_time",  &ChildAgentReport::execution_time)
        .def_readwrite("timestamp",       &ChildAgentReport::timestamp)
        .def_readwrite("children",        &ChildAgentReport::children)
        .def("__repr__", [](const ChildAgentReport& r) {
            return "<ChildAgentReport child='" + r.child_id + "' status=" +
                   std::string(to_string(r.status)) + ">";
        });

    py::class_<ChildTermination>(m, "ChildTermination")
        .def(py::init<>())
        .def_readwrite("report", &ChildTermination::report)
        .def_readwrite("error",  &ChildTermination::error)
        .def("ok", &ChildTermination::ok);

    py::class_<TerminationReport>(m, "TerminationReport")
        .def(py::init<>())
        .def_readwrite("agent_id", &TerminationReport::agent_id)
        .def_readwrite("children", &TerminationReport::children)
        .def("failed_children", &TerminationReport::failed_children);

    // ===================================================================
    // AgentServices
    // ===================================================================
    py::class_<AgentServices>(m, "AgentServices")
        .def(py::init<>())
        .def_readwrite("governor", &AgentServices::governor)
        .def_readwrite("random",   &AgentServices::random)
        .def_readwrite("model",    &AgentServices::model)
        .def_readwrite("monitor",  &AgentServices::monitor)
        .def_readwrite("ids",      &AgentServices::ids)
        .def_readwrite("config",   &AgentServices::config);

    // ===================================================================
    // CognitiveAgent
    // ===================================================================
    py::class_<CognitiveAgent, std::shared_ptr<CognitiveAgent>>(m, "CognitiveAgent")
        .def(py::init<AgentId, AgentRole, ContextThread, AgentServices>(),
             py::arg("id"), py::arg("role"), py::arg("thread"), py::arg("services"))
        // Identity
        .def("id",             &CognitiveAgent::id)
        .def("role",           &CognitiveAgent::role)
        .def("parent_id",      &CognitiveAgent::parent_id)
        .def("context_thread", &CognitiveAgent::context_thread)

        // ------------- Loop -------------
        .def("process_input", &CognitiveAgent::process_input,
             py::arg("input"),
             py::call_guard<py::gil_scoped_release>())
        .def("execute_roundabout_loop", &CognitiveAgent::execute_roundabout_loop,
             py::call_guard<py::gil_scoped_release>())

        // ------------- Hierarchy -------------
        .def("clone", &CognitiveAgent::clone,
             py::arg("child_profile"), py::arg("task_definition"),
             py::arg("child_role") = AgentRole::Core,
             py::call_guard<py::gil_scoped_release>())
        .def("terminate",     &CognitiveAgent::terminate,
             py::call_guard<py::gil_scoped_release>())
        .def("child",         &CognitiveAgent::child, py::arg("child_id"))
        .def("children",      &CognitiveAgent::children)
        .def("child_reports", &CognitiveAgent::child_reports)
        .def("remove_child",  &CognitiveAgent::remove_child, py::arg("child_id"),
             py::call_guard<py::gil_scoped_release>())

        // ------------- State -------------
        .def("calculate_relational_delta", &CognitiveAgent::calculate_relational_delta,
             py::arg("user_state"))
        .def("update_state",       &CognitiveAgent::update_state, py::arg("update"))
        .def("state",              &CognitiveAgent::state)
        .def("phase",              &CognitiveAgent::phase)
        .def("is_active",          &CognitiveAgent::is_active)
        .def("is_halted",          &CognitiveAgent::is_halted)
        .def("status",             &CognitiveAgent::status)
        .def("resource_usage",     &CognitiveAgent::resource_usage)
        .def("failure_history",    &CognitiveAgent::failure_history)
        .def("adaptation_context", &CognitiveAgent::adaptation_context)
        .def("current_plan",       &CognitiveAgent::current_plan)
        // __repr__
        .def("__repr__", [](const CognitiveAgent& a) {
            return "<CognitiveAgent id='" + a.id() + "' role=" + to_string(a.role()) +
                   " phase=" + to_string(a.phase()) + ">";
        });

    // ===================================================================
    // AgentFactory
    // ===================================================================
    py::class_<AgentFactory>(m, "AgentFactory")
        .def(py::init<AgentServices>(), py::arg("services"))
        .def("create_agent", &AgentFactory::create_agent,
             py::arg("profile"), py::arg("role"),
             py::arg("top_level_goal") = "Process user input",
             py::arg("task_definition") = "Handle user request")
        .def("agent",              &AgentFactory::agent, py::arg("id"))
        .def("active_agents",      &AgentFactory::active_agents)
        .def("active_agent_count", &AgentFactory::active_agent_count)
        .def("terminate_all",      &AgentFactory::terminate_all,
             py::call_guard<py::gil_scoped_release>())
        .def("services",           &AgentFactory::services);
}
