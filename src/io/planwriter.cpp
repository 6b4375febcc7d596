#include "planwriter.hpp"

#include "../instance/plan.hpp"     // for ProjectPlan
#include "../instance/task.hpp"     // for Task
#include "../tools/statistics.hpp"  // for PlanStatistics

#include <boost/date_time/gregorian/gregorian.hpp> // for to_iso_extended_string

#include <fstream>  // for basic_ostream, ofstream, operator<<
#include <iomanip>  // for operator<<, setw
#include <stdexcept>

namespace {

template <class T>
nlohmann::json
maybe_to_json(const Maybe<T> & value)
{
	if (!value.valid()) {
		return nullptr;
	}
	return value.value();
}

nlohmann::json
date_to_json(const Maybe<boost::gregorian::date> & value)
{
	if (!value.valid()) {
		return nullptr;
	}
	return boost::gregorian::to_iso_extended_string(value.value());
}

} // namespace

PlanWriter::PlanWriter(const ProjectPlan & plan_in) : plan(plan_in)
{
	this->prepare();
	this->dump_tasks();
}

void
PlanWriter::prepare()
{
	j["title"] = this->plan.get_title();
	j["description"] = maybe_to_json(this->plan.get_description());
	j["start_date"] = date_to_json(this->plan.get_start_date());
	j["end_date"] = date_to_json(this->plan.get_end_date());
	j["working_days"] = this->plan.get_working_days();
}

void
PlanWriter::dump_tasks()
{
	j["tasks"] = nlohmann::json::array();

	for (const Task & task : this->plan.get_tasks()) {
		nlohmann::json task_json;
		task_json["id"] = task.get_id();
		task_json["name"] = task.get_name();
		task_json["dependencies"] = task.get_dependencies();
		task_json["start_date"] = date_to_json(task.get_start_date());
		task_json["end_date"] = date_to_json(task.get_end_date());
		task_json["duration"] = maybe_to_json(task.get_duration());
		task_json["is_milestone"] = task.is_milestone();
		task_json["status"] = task.get_status().labels();
		task_json["section"] = maybe_to_json(task.get_section());
		task_json["description"] = maybe_to_json(task.get_description());
		task_json["assignee"] = maybe_to_json(task.get_assignee());

		j["tasks"].push_back(task_json);
	}
}

void
PlanWriter::add_statistics(const PlanStatistics & stats)
{
	nlohmann::json s;
	s["total_tasks"] = stats.total_tasks;
	s["completed_tasks"] = stats.completed_tasks;
	s["active_tasks"] = stats.active_tasks;
	s["critical_tagged_tasks"] = stats.critical_tagged_tasks;
	s["milestone_count"] = stats.milestone_count;
	s["total_duration"] = stats.total_duration;
	s["start_date"] = date_to_json(stats.start_date);
	s["end_date"] = date_to_json(stats.end_date);
	s["completion_rate"] = stats.completion_rate;
	s["critical_path_length"] = stats.critical_path_length;
	s["sections"] = stats.sections;

	j["statistics"] = s;
}

void
PlanWriter::add_critical_path(const std::vector<const Task *> & critical_path)
{
	j["critical_path"] = nlohmann::json::array();
	for (const Task * task : critical_path) {
		j["critical_path"].push_back(task->get_id());
	}
}

const nlohmann::json &
PlanWriter::get_json() const
{
	return this->j;
}

void
PlanWriter::write_to(std::string filename)
{
	std::ofstream output_file(filename);
	if (!output_file) {
		throw std::runtime_error("Could not open " + filename + " for writing");
	}
	output_file << std::setw(2) << j << "\n";
}
