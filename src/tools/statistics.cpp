#include "statistics.hpp"

#include "../algorithms/graphalgos.hpp" // for CriticalPathComputer
#include "../calendar/calendar.hpp"     // for WorkingCalendar
#include "../instance/plan.hpp"         // for ProjectPlan
#include "../instance/task.hpp"         // for Task

StatisticsReporter::StatisticsReporter(const ProjectPlan & plan_in)
    : plan(plan_in), l("STATS")
{}

PlanStatistics
StatisticsReporter::get() const
{
	PlanStatistics stats;

	stats.total_tasks = this->plan.task_count();
	stats.completed_tasks = this->plan.completed_count();
	stats.milestone_count = this->plan.milestone_count();
	stats.critical_tagged_tasks =
	    (unsigned int)this->plan.get_critical_tagged_tasks().size();

	stats.active_tasks = 0;
	for (const Task & task : this->plan.get_tasks()) {
		if (task.get_status().has(StatusSet::Tag::ACTIVE)) {
			stats.active_tasks++;
		}
	}

	stats.start_date = this->plan.get_start_date();
	stats.end_date = this->plan.get_end_date();

	stats.total_duration = 0;
	if (stats.start_date.valid() && stats.end_date.valid()) {
		WorkingCalendar calendar(this->plan.get_working_days());
		stats.total_duration = calendar.count_working_days(
		                           stats.start_date.value(), stats.end_date.value()) +
		                       1;
	}

	if (stats.total_tasks > 0) {
		stats.completion_rate =
		    (double)stats.completed_tasks / (double)stats.total_tasks * 100.0;
	} else {
		stats.completion_rate = 0.0;
	}

	stats.critical_path_length = 0;
	if (stats.total_tasks > 0) {
		CriticalPathComputer cpc(this->plan);
		stats.critical_path_length = (unsigned int)cpc.get_critical_path().size();
	}

	stats.sections = this->plan.get_sections();

	BOOST_LOG(l.d()) << "Plan '" << this->plan.get_title() << "': "
	                 << stats.total_tasks << " tasks, " << stats.total_duration
	                 << " working days";

	return stats;
}
