#include "plan.hpp"

#include <algorithm> // for find
#include <utility>   // for move

ProjectPlan::ProjectPlan() : ProjectPlan("Project Plan") {}

ProjectPlan::ProjectPlan(std::string title_in)
    : title(std::move(title_in)), working_days({0, 1, 2, 3, 4})
{}

const std::string &
ProjectPlan::get_title() const
{
	return this->title;
}

void
ProjectPlan::set_title(std::string title_in)
{
	this->title = std::move(title_in);
}

const Maybe<std::string> &
ProjectPlan::get_description() const
{
	return this->description;
}

void
ProjectPlan::set_description(Maybe<std::string> description_in)
{
	this->description = std::move(description_in);
}

const Maybe<ProjectPlan::date> &
ProjectPlan::get_start_date() const
{
	return this->start_date;
}

void
ProjectPlan::set_start_date(Maybe<date> start)
{
	this->start_date = start;
}

const Maybe<ProjectPlan::date> &
ProjectPlan::get_end_date() const
{
	return this->end_date;
}

void
ProjectPlan::set_end_date(Maybe<date> end)
{
	this->end_date = end;
}

const std::set<unsigned int> &
ProjectPlan::get_working_days() const
{
	return this->working_days;
}

void
ProjectPlan::set_working_days(std::set<unsigned int> days)
{
	this->working_days = std::move(days);
}

unsigned int
ProjectPlan::add_task(Task && task)
{
	unsigned int index = (unsigned int)this->tasks.size();
	this->index_by_id.emplace(task.get_id(), index);
	this->tasks.push_back(std::move(task));
	return index;
}

unsigned int
ProjectPlan::task_count() const
{
	return (unsigned int)this->tasks.size();
}

const Task &
ProjectPlan::get_task(unsigned int i) const
{
	return this->tasks[i];
}

Task &
ProjectPlan::get_task(unsigned int i)
{
	return this->tasks[i];
}

bool
ProjectPlan::get_index(const std::string & id, unsigned int & index) const
{
	auto it = this->index_by_id.find(id);
	if (it == this->index_by_id.end()) {
		return false;
	}
	index = it->second;
	return true;
}

const Task *
ProjectPlan::find_task(const std::string & id) const
{
	unsigned int index;
	if (!this->get_index(id, index)) {
		return nullptr;
	}
	return &this->tasks[index];
}

Task *
ProjectPlan::find_task(const std::string & id)
{
	unsigned int index;
	if (!this->get_index(id, index)) {
		return nullptr;
	}
	return &this->tasks[index];
}

const std::vector<Task> &
ProjectPlan::get_tasks() const
{
	return this->tasks;
}

unsigned int
ProjectPlan::milestone_count() const
{
	unsigned int count = 0;
	for (const Task & task : this->tasks) {
		if (task.is_milestone()) {
			count++;
		}
	}
	return count;
}

unsigned int
ProjectPlan::completed_count() const
{
	unsigned int count = 0;
	for (const Task & task : this->tasks) {
		if (task.get_status().has(StatusSet::Tag::DONE)) {
			count++;
		}
	}
	return count;
}

std::vector<const Task *>
ProjectPlan::get_critical_tagged_tasks() const
{
	std::vector<const Task *> result;
	for (const Task & task : this->tasks) {
		if (task.get_status().has(StatusSet::Tag::CRITICAL)) {
			result.push_back(&task);
		}
	}
	return result;
}

std::vector<std::string>
ProjectPlan::get_sections() const
{
	std::set<std::string> sections;
	for (const Task & task : this->tasks) {
		if (task.get_section().valid()) {
			sections.insert(task.get_section().value());
		}
	}
	return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<const Task *>
ProjectPlan::get_tasks_by_section(const std::string & section) const
{
	std::vector<const Task *> result;
	for (const Task & task : this->tasks) {
		if (task.get_section().valid() && task.get_section().value() == section) {
			result.push_back(&task);
		}
	}
	return result;
}

std::vector<const Task *>
ProjectPlan::get_task_dependencies(const std::string & id) const
{
	std::vector<const Task *> result;
	const Task * task = this->find_task(id);
	if (task == nullptr) {
		return result;
	}

	for (const auto & dep_id : task->get_dependencies()) {
		const Task * dep = this->find_task(dep_id);
		if (dep != nullptr) {
			result.push_back(dep);
		}
	}
	return result;
}

std::vector<const Task *>
ProjectPlan::get_task_dependents(const std::string & id) const
{
	std::vector<const Task *> result;
	for (const Task & task : this->tasks) {
		const auto & deps = task.get_dependencies();
		if (std::find(deps.begin(), deps.end(), id) != deps.end()) {
			result.push_back(&task);
		}
	}
	return result;
}
