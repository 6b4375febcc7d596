#include "graphalgos.hpp"

#include "../instance/plan.hpp"    // for ProjectPlan
#include "../instance/task.hpp"    // for Task
#include "../manager/errors.hpp"   // for CycleDetectedError, InconsistentDataError
#include "../util/fault_codes.hpp" // for FAULT_UNDATED_TASK

#include <algorithm> // for reverse
#include <stdexcept> // for out_of_range
#include <string>    // for string

TopologicalSort::TopologicalSort(const TaskGraph & graph_in) : graph(graph_in) {}

std::vector<TopologicalSort::vertex>
TopologicalSort::get()
{
	this->run([](vertex v) { (void)v; });
	return this->order;
}

bool
TopologicalSort::is_complete() const
{
	return this->order.size() == this->graph.vertex_count();
}

std::vector<TopologicalSort::vertex>
TopologicalSort::get_unprocessed() const
{
	std::vector<vertex> unprocessed;
	for (vertex v = 0; v < this->processed.size(); ++v) {
		if (!this->processed[v]) {
			unprocessed.push_back(v);
		}
	}
	return unprocessed;
}

CycleDetector::CycleDetector(const ProjectPlan & plan_in) : plan(plan_in)
{
	TaskGraph graph(this->plan);
	TopologicalSort ts(graph);
	ts.get();

	for (auto v : ts.get_unprocessed()) {
		this->unprocessed_ids.insert(this->plan.get_task(v).get_id());
	}
}

bool
CycleDetector::has_cycle() const
{
	return !this->unprocessed_ids.empty();
}

const std::set<std::string> &
CycleDetector::get_unprocessed_ids() const
{
	return this->unprocessed_ids;
}

void
CycleDetector::check() const
{
	if (this->has_cycle()) {
		throw CycleDetectedError(this->plan.get_title(), this->unprocessed_ids);
	}
}

CriticalPathComputer::CriticalPathComputer(const ProjectPlan & plan_in)
    : l("CRITPATH"), plan(plan_in), calendar(plan_in.get_working_days()),
      graph(plan_in)
{
	TopologicalSort ts(this->graph);
	this->topological_order = ts.get();

	if (!ts.is_complete()) {
		std::set<std::string> ids;
		for (auto v : ts.get_unprocessed()) {
			ids.insert(this->plan.get_task(v).get_id());
		}
		throw CycleDetectedError(this->plan.get_title(), std::move(ids));
	}

	for (vertex v = 0; v < this->plan.task_count(); ++v) {
		const Task & task = this->plan.get_task(v);
		if (!task.get_start_date().valid()) {
			BOOST_LOG(l.e()) << "Task " << task.get_id() << " has no start date.";
			throw InconsistentDataError(this->plan.get_title(), FAULT_UNDATED_TASK,
			                            "Task " + task.get_id() +
			                                " must be scheduled before its slack "
			                                "can be computed");
		}
	}

	try {
		this->compute_forward();
		this->compute_reverse();
	} catch (const std::out_of_range & e) {
		BOOST_LOG(l.e()) << "Date arithmetic failed: " << e.what();
		throw InconsistentDataError(this->plan.get_title(), FAULT_DATE_OUT_OF_RANGE,
		                            std::string("Slack computation leaves the "
		                                        "supported calendar range: ") +
		                                e.what());
	}
}

void
CriticalPathComputer::compute_forward()
{
	this->earliest_start.assign(this->plan.task_count(), date());

	for (auto v : this->topological_order) {
		const Task & task = this->plan.get_task(v);
		this->earliest_start[v] = task.get_start_date().value();

		Maybe<date> latest_dep_end;
		for (auto dep : this->graph.dependencies(v)) {
			const auto & dep_end = this->plan.get_task(dep).get_end_date();
			if (!dep_end.valid()) {
				continue;
			}
			if (!latest_dep_end.valid() || dep_end.value() > latest_dep_end.value()) {
				latest_dep_end = dep_end;
			}
		}

		if (latest_dep_end.valid()) {
			this->earliest_start[v] =
			    this->calendar.add_working_days(latest_dep_end.value(), 1);
		}
	}
}

void
CriticalPathComputer::compute_reverse()
{
	std::vector<vertex> reverse_order = this->topological_order;
	std::reverse(reverse_order.begin(), reverse_order.end());

	this->latest_start.assign(this->plan.task_count(), date());

	for (auto v : reverse_order) {
		const auto & dependents = this->graph.dependents(v);
		if (dependents.empty()) {
			this->latest_start[v] = this->earliest_start[v];
			continue;
		}

		const Task & task = this->plan.get_task(v);
		unsigned int duration = task.get_duration().value_or_default(0);
		if (!task.get_duration().valid()) {
			BOOST_LOG(l.d(1)) << "Task " << task.get_id()
			                  << " has no duration, counting it as 0";
		}

		Maybe<date> min_dependent_start;
		for (auto dependent : dependents) {
			const date & candidate = this->latest_start[dependent];
			if (!min_dependent_start.valid() ||
			    candidate < min_dependent_start.value()) {
				min_dependent_start = candidate;
			}
		}

		this->latest_start[v] = this->calendar.subtract_working_days(
		    min_dependent_start.value(), duration);
	}
}

const std::vector<CriticalPathComputer::date> &
CriticalPathComputer::get_forward() const
{
	return this->earliest_start;
}

const std::vector<CriticalPathComputer::date> &
CriticalPathComputer::get_reverse() const
{
	return this->latest_start;
}

std::vector<const Task *>
CriticalPathComputer::get_critical_path() const
{
	std::vector<const Task *> critical;
	for (auto v : this->topological_order) {
		if (this->earliest_start[v] == this->latest_start[v]) {
			critical.push_back(&this->plan.get_task(v));
		}
	}

	BOOST_LOG(l.d()) << critical.size() << " of " << this->plan.task_count()
	                 << " tasks have zero slack";
	return critical;
}

int
CriticalPathComputer::get_slack(vertex i) const
{
	const date & es = this->earliest_start[i];
	const date & ls = this->latest_start[i];

	if (es == ls) {
		return 0;
	} else if (es < ls) {
		return (int)this->calendar.count_working_days(
		    es + boost::gregorian::days(1), ls);
	} else {
		return -(int)this->calendar.count_working_days(
		    ls + boost::gregorian::days(1), es);
	}
}
