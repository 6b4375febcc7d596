#include "task.hpp"

#include <utility> // for move

Task::Task() : milestone(false) {}

Task::Task(std::string id_in, std::string name_in)
    : id(std::move(id_in)), name(std::move(name_in)), milestone(false)
{
	if (this->name.empty()) {
		this->name = this->id;
	}
}

const std::string &
Task::get_id() const
{
	return this->id;
}

const std::string &
Task::get_name() const
{
	return this->name;
}

void
Task::set_name(std::string name_in)
{
	this->name = std::move(name_in);
}

const std::vector<std::string> &
Task::get_dependencies() const
{
	return this->dependencies;
}

void
Task::set_dependencies(std::vector<std::string> dependencies_in)
{
	this->dependencies = std::move(dependencies_in);
}

void
Task::add_dependency(std::string dep_id)
{
	this->dependencies.push_back(std::move(dep_id));
}

bool
Task::has_dependencies() const
{
	return !this->dependencies.empty();
}

const Maybe<Task::date> &
Task::get_start_date() const
{
	return this->start_date;
}

void
Task::set_start_date(Maybe<date> start)
{
	this->start_date = start;
}

const Maybe<Task::date> &
Task::get_end_date() const
{
	return this->end_date;
}

void
Task::set_end_date(Maybe<date> end)
{
	this->end_date = end;
}

const Maybe<unsigned int> &
Task::get_duration() const
{
	return this->duration;
}

void
Task::set_duration(Maybe<unsigned int> duration_in)
{
	this->duration = duration_in;
}

bool
Task::is_milestone() const
{
	return this->milestone;
}

void
Task::set_milestone(bool milestone_in)
{
	this->milestone = milestone_in;
}

const StatusSet &
Task::get_status() const
{
	return this->status;
}

StatusSet &
Task::get_status()
{
	return this->status;
}

void
Task::set_status(StatusSet status_in)
{
	this->status = std::move(status_in);
}

const Maybe<std::string> &
Task::get_section() const
{
	return this->section;
}

void
Task::set_section(Maybe<std::string> section_in)
{
	this->section = std::move(section_in);
}

const Maybe<std::string> &
Task::get_description() const
{
	return this->description;
}

void
Task::set_description(Maybe<std::string> description_in)
{
	this->description = std::move(description_in);
}

const Maybe<std::string> &
Task::get_assignee() const
{
	return this->assignee;
}

void
Task::set_assignee(Maybe<std::string> assignee_in)
{
	this->assignee = std::move(assignee_in);
}

bool
Task::is_dated() const
{
	return this->start_date.valid() && this->end_date.valid() &&
	       this->duration.valid();
}
