#include "datescheduler.hpp"

#include "../algorithms/graphalgos.hpp" // for TopologicalSort
#include "../instance/task.hpp"         // for Task
#include "../manager/errors.hpp"        // for CycleDetectedError
#include "../util/fault_codes.hpp"       // for FAULT_DATE_OUT_OF_RANGE

#include <boost/date_time/gregorian/gregorian.hpp> // for operator<<

#include <set>     // for set
#include <stdexcept> // for out_of_range
#include <utility> // for move

DateScheduler::DateScheduler(const ProjectPlan & plan_in,
                             Maybe<date> reference_date_in)
    : plan(plan_in), calendar(plan_in.get_working_days()),
      reference_date(reference_date_in), solution(plan_in), solved(false),
      l("SCHEDULER")
{}

void
DateScheduler::run()
{
	BOOST_LOG(l.d()) << "Scheduling plan '" << this->plan.get_title() << "' with "
	                 << this->plan.task_count() << " tasks";

	ProjectPlan working(this->plan);
	TaskGraph graph(working);
	TopologicalSort ts(graph);

	try {
		ts.run([&](TaskGraph::vertex v) { this->derive_dates(working, graph, v); });
	} catch (const std::out_of_range & e) {
		// boost::gregorian::bad_year and friends
		BOOST_LOG(l.e()) << "Date arithmetic failed: " << e.what();
		throw InconsistentDataError(this->plan.get_title(), FAULT_DATE_OUT_OF_RANGE,
		                            std::string("Derived dates leave the supported "
		                                        "calendar range: ") +
		                                e.what());
	}

	if (!ts.is_complete()) {
		std::set<std::string> unprocessed;
		for (auto v : ts.get_unprocessed()) {
			unprocessed.insert(working.get_task(v).get_id());
		}
		BOOST_LOG(l.w()) << unprocessed.size()
		                 << " tasks could not be ordered, aborting.";
		throw CycleDetectedError(this->plan.get_title(), std::move(unprocessed));
	}

	this->update_plan_dates(working);

	this->solution = std::move(working);
	this->solved = true;

	BOOST_LOG(l.d()) << "Scheduled " << this->solution.task_count() << " tasks";
}

const ProjectPlan &
DateScheduler::get_solution() const
{
	return this->solution;
}

bool
DateScheduler::has_solution() const
{
	return this->solved;
}

unsigned int
DateScheduler::span_of(unsigned int duration)
{
	return duration > 0 ? duration - 1 : 0;
}

void
DateScheduler::derive_dates(ProjectPlan & working, const TaskGraph & graph,
                            TaskGraph::vertex v)
{
	Task & task = working.get_task(v);

	if (task.is_milestone()) {
		task.set_duration(0);
	}

	if (task.has_dependencies()) {
		Maybe<date> latest_end;
		for (auto dep : graph.dependencies(v)) {
			const auto & dep_end = working.get_task(dep).get_end_date();
			if (dep_end.valid() &&
			    (!latest_end.valid() || dep_end.value() > latest_end.value())) {
				latest_end = dep_end;
			}
		}

		if (latest_end.valid()) {
			task.set_start_date(this->calendar.add_working_days(latest_end.value(), 1));
		}
	}

	const auto & start = task.get_start_date();
	const auto & end = task.get_end_date();
	const auto & duration = task.get_duration();

	if (start.valid() && duration.valid()) {
		task.set_end_date(this->calendar.add_working_days(
		    start.value(), span_of(duration.value())));
	} else if (start.valid() && end.valid()) {
		task.set_duration(
		    this->calendar.count_working_days(start.value(), end.value()) + 1);
	} else if (end.valid() && duration.valid()) {
		task.set_start_date(this->calendar.subtract_working_days(
		    end.value(), span_of(duration.value())));
	}

	if (!task.get_start_date().valid()) {
		task.set_start_date(this->get_fallback_start(working));

		if (task.get_duration().valid()) {
			task.set_end_date(this->calendar.add_working_days(
			    task.get_start_date().value(), span_of(task.get_duration().value())));
		}
	}

	BOOST_LOG(l.d(1)) << "Task " << task.get_id() << ": "
	                  << task.get_start_date().value() << " - "
	                  << task.get_end_date().value();
}

DateScheduler::date
DateScheduler::get_fallback_start(const ProjectPlan & working)
{
	if (working.get_start_date().valid()) {
		return working.get_start_date().value();
	}

	if (!this->reference_date.valid()) {
		this->reference_date = boost::gregorian::day_clock::local_day();
		BOOST_LOG(l.w()) << "Neither the plan nor the caller provide a start date, "
		                 << "using today (" << this->reference_date.value() << ")";
	}

	return this->reference_date.value();
}

void
DateScheduler::update_plan_dates(ProjectPlan & working) const
{
	Maybe<date> earliest;
	Maybe<date> latest;

	for (const Task & task : working.get_tasks()) {
		const auto & start = task.get_start_date();
		if (start.valid() && (!earliest.valid() || start.value() < earliest.value())) {
			earliest = start;
		}

		const auto & end = task.get_end_date();
		if (end.valid() && (!latest.valid() || end.value() > latest.value())) {
			latest = end;
		}
	}

	if (earliest.valid()) {
		working.set_start_date(earliest);
	}
	if (latest.valid()) {
		working.set_end_date(latest);
	}
}
