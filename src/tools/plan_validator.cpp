#include "plan_validator.hpp"

#include "../algorithms/graphalgos.hpp" // for CycleDetector
#include "../instance/plan.hpp"         // for ProjectPlan
#include "../instance/task.hpp"         // for Task
#include "../manager/errors.hpp"        // for CycleDetectedError

PlanValidator::PlanValidator(const ProjectPlan & plan_in)
    : plan(plan_in), l("VALIDATOR")
{}

std::vector<Diagnostic>
PlanValidator::validate() const
{
	std::vector<Diagnostic> diagnostics;

	if (this->plan.task_count() == 0) {
		diagnostics.push_back({Diagnostic::Kind::EMPTY_PLAN, "",
		                       "The plan does not contain any tasks"});
		return diagnostics;
	}

	this->check_tasks(diagnostics);
	this->check_cycles(diagnostics);

	BOOST_LOG(l.d()) << "Found " << diagnostics.size() << " problems in plan '"
	                 << this->plan.get_title() << "'";

	return diagnostics;
}

void
PlanValidator::check_tasks(std::vector<Diagnostic> & diagnostics) const
{
	for (const Task & task : this->plan.get_tasks()) {
		const std::string label = "Task '" + task.get_name() + "' (" + task.get_id() + ")";

		if (!task.get_start_date().valid() && !task.get_duration().valid() &&
		    !task.has_dependencies()) {
			diagnostics.push_back({Diagnostic::Kind::MISSING_TIME_INFORMATION,
			                       task.get_id(),
			                       label + " is missing basic time information"});
		}

		if (task.get_start_date().valid() && task.get_end_date().valid() &&
		    task.get_start_date().value() > task.get_end_date().value()) {
			diagnostics.push_back({Diagnostic::Kind::START_AFTER_END, task.get_id(),
			                       label + " starts after its end date"});
		}
	}
}

void
PlanValidator::check_cycles(std::vector<Diagnostic> & diagnostics) const
{
	try {
		CycleDetector(this->plan).check();
	} catch (const CycleDetectedError & e) {
		diagnostics.push_back({Diagnostic::Kind::DEPENDENCY_CYCLE, "", e.what()});
	}
}
