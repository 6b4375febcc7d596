#include "planreader.hpp"

#include "../instance/task.hpp" // for Task

#include <boost/date_time/gregorian/gregorian.hpp> // for from_simple_string

#include <cstdint> // for int64_t, uint64_t
#include <fstream> // for ifstream
#include <set>     // for set
#include <sstream> // for stringstream
#include <string>  // for to_string
#include <utility> // for move
#include <vector>  // for vector

using json = nlohmann::json;

namespace {

/*
 * Reads a non-negative integer no larger than max. Floating point values,
 * negative values and values that do not fit are rejected instead of being
 * narrowed.
 */
bool
get_bounded_unsigned(const json & value, unsigned int max, unsigned int & out)
{
	if (!value.is_number_integer()) {
		return false;
	}

	std::uint64_t raw;
	if (value.is_number_unsigned()) {
		raw = value.get<std::uint64_t>();
	} else {
		auto signed_raw = value.get<std::int64_t>();
		if (signed_raw < 0) {
			return false;
		}
		raw = static_cast<std::uint64_t>(signed_raw);
	}

	if (raw > max) {
		return false;
	}
	out = static_cast<unsigned int>(raw);
	return true;
}

} // namespace

PlanMalformedException::PlanMalformedException(const std::string & what)
    : std::runtime_error(what)
{}

PlanReader::PlanReader(std::string filename_in)
    : filename(std::move(filename_in)), l("PLANREADER")
{}

PlanReader::PlanReader(json js_in) : js(std::move(js_in)), l("PLANREADER") {}

ProjectPlan
PlanReader::parse()
{
	if (this->filename.valid()) {
		this->read_file();
	}

	if (!this->js.is_object()) {
		throw PlanMalformedException("A plan must be a JSON object");
	}

	ProjectPlan plan;
	this->parse_header(plan);
	this->parse_tasks(plan);
	this->check_references(plan);

	BOOST_LOG(l.d()) << "Read plan '" << plan.get_title() << "' with "
	                 << plan.task_count() << " tasks";

	return plan;
}

void
PlanReader::read_file()
{
	std::ifstream in_stream(this->filename.value());
	if (!in_stream) {
		throw PlanMalformedException("Could not open plan file " +
		                             this->filename.value());
	}

	std::stringstream buffer;
	buffer << in_stream.rdbuf();
	BOOST_LOG(l.d()) << "Parsing " << this->filename.value();

	try {
		this->js = json::parse(buffer.str());
	} catch (const json::parse_error & e) {
		BOOST_LOG(l.e()) << "JSON Parsing error in plan file.";
		BOOST_LOG(l.e()) << e.what();
		BOOST_LOG(l.e()) << "Error is near byte " << e.byte;
		throw PlanMalformedException("Plan file " + this->filename.value() +
		                             " is not valid JSON");
	}
}

void
PlanReader::parse_header(ProjectPlan & plan)
{
	if (this->js.contains("title")) {
		plan.set_title(get_json<std::string>("title", this->js));
	}
	plan.set_description(this->get_optional_string(this->js, "description"));
	plan.set_start_date(this->get_date(this->js, "start_date"));
	plan.set_end_date(this->get_date(this->js, "end_date"));

	if (this->js.contains("working_days")) {
		std::set<unsigned int> days;
		for (const json & day : this->js.at("working_days")) {
			unsigned int index;
			if (!get_bounded_unsigned(day, 6, index)) {
				throw PlanMalformedException(
				    "Working days must be integers from 0 (Monday) to 6 (Sunday)");
			}
			days.insert(index);
		}
		plan.set_working_days(std::move(days));
	}
}

void
PlanReader::parse_tasks(ProjectPlan & plan)
{
	if (!this->js.contains("tasks") || !this->js.at("tasks").is_array()) {
		throw PlanMalformedException("A plan needs a 'tasks' array");
	}

	std::set<std::string> seen_ids;
	for (const json & task_data : this->js.at("tasks")) {
		Task task = this->parse_task(task_data);

		if (!seen_ids.insert(task.get_id()).second) {
			throw PlanMalformedException("Task IDs must be unique, " + task.get_id() +
			                             " occurs more than once.");
		}

		plan.add_task(std::move(task));
	}
}

Task
PlanReader::parse_task(const json & task_data)
{
	if (!task_data.is_object()) {
		throw PlanMalformedException("Every task must be a JSON object");
	}

	std::string id = get_json<std::string>("id", task_data);
	std::string name;
	if (task_data.contains("name")) {
		name = get_json<std::string>("name", task_data);
	}

	Task task(id, name);

	if (task_data.contains("dependencies")) {
		task.set_dependencies(
		    get_json<std::vector<std::string>>("dependencies", task_data));
	}

	task.set_start_date(this->get_date(task_data, "start_date"));
	task.set_end_date(this->get_date(task_data, "end_date"));

	if (task_data.contains("duration") && !task_data.at("duration").is_null()) {
		unsigned int duration;
		if (!get_bounded_unsigned(task_data.at("duration"), MAX_DURATION, duration)) {
			throw PlanMalformedException("Duration of task " + id +
			                             " must be an integer from 0 to " +
			                             std::to_string(MAX_DURATION));
		}
		task.set_duration(duration);
	}

	if (task_data.contains("is_milestone")) {
		task.set_milestone(get_json<bool>("is_milestone", task_data));
	}

	if (task.is_milestone() && task.get_duration().valid() &&
	    task.get_duration().value() != 0) {
		throw PlanMalformedException("Milestone " + id +
		                             " must have a duration of 0");
	}

	if (task_data.contains("status")) {
		for (const auto & label :
		     get_json<std::vector<std::string>>("status", task_data)) {
			if (!task.get_status().add(label)) {
				BOOST_LOG(l.d(1)) << "Task " << id << " has custom status '" << label
				                  << "'";
			}
		}
	}

	task.set_section(this->get_optional_string(task_data, "section"));
	task.set_description(this->get_optional_string(task_data, "description"));
	task.set_assignee(this->get_optional_string(task_data, "assignee"));

	return task;
}

void
PlanReader::check_references(const ProjectPlan & plan)
{
	for (const Task & task : plan.get_tasks()) {
		for (const auto & dep_id : task.get_dependencies()) {
			if (plan.find_task(dep_id) == nullptr) {
				throw PlanMalformedException("Task " + task.get_id() +
				                             " depends on unknown task " + dep_id);
			}
		}
	}
}

Maybe<boost::gregorian::date>
PlanReader::get_date(const json & js_in, const char * key)
{
	if (!js_in.contains(key) || js_in.at(key).is_null()) {
		return Maybe<boost::gregorian::date>();
	}

	std::string text = get_json<std::string>(key, js_in);
	try {
		return boost::gregorian::from_simple_string(text);
	} catch (const std::exception & e) {
		BOOST_LOG(l.e()) << "Could not parse date '" << text << "': " << e.what();
		throw PlanMalformedException("Invalid date '" + text + "' for key '" +
		                             key + "', expected YYYY-MM-DD");
	}
}

Maybe<std::string>
PlanReader::get_optional_string(const json & js_in, const char * key)
{
	if (!js_in.contains(key) || js_in.at(key).is_null()) {
		return Maybe<std::string>();
	}
	return get_json<std::string>(key, js_in);
}
