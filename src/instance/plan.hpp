#ifndef PLAN_HPP
#define PLAN_HPP

#include "../datastructures/maybe.hpp" // for Maybe
#include "task.hpp"                    // for Task

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief A project plan
 *
 * A project plan consists of the following data:
 *   - a title and an optional description
 *   - an ordered list of tasks. The order is the insertion order and is kept
 *     stable so that output is reproducible.
 *   - a start and an end date. Both are derived by the scheduler; before
 *     scheduling the start date (if given) serves as the default start of
 *     tasks that have no other time information.
 *   - the set of working weekdays (0 = Monday, 6 = Sunday), shared by all
 *     tasks
 *
 * The plan does not check id uniqueness or dependency existence. That is the
 * responsibility of whoever constructs it (see PlanReader).
 */
class ProjectPlan {
public:
	using date = boost::gregorian::date;

	/**
	 * Creates an empty plan working Monday to Friday.
	 */
	ProjectPlan();

	ProjectPlan(std::string title);

	const std::string & get_title() const;
	void set_title(std::string title);

	const Maybe<std::string> & get_description() const;
	void set_description(Maybe<std::string> description);

	const Maybe<date> & get_start_date() const;
	void set_start_date(Maybe<date> start);

	const Maybe<date> & get_end_date() const;
	void set_end_date(Maybe<date> end);

	const std::set<unsigned int> & get_working_days() const;
	void set_working_days(std::set<unsigned int> days);

	/**
	 * Appends a task to this plan
	 *
	 * @param task that should be added
	 *
	 * @return the index of the task
	 */
	unsigned int add_task(Task && task);

	/**
	 * Returns the number of tasks this plan has
	 */
	unsigned int task_count() const;

	/**
	 * Returns the task with the given index
	 */
	const Task & get_task(unsigned int i) const;
	Task & get_task(unsigned int i);

	/**
	 * Returns the task with the given ID, or nullptr if there is none.
	 */
	const Task * find_task(const std::string & id) const;
	Task * find_task(const std::string & id);

	/**
	 * Returns the index of the task with the given ID
	 *
	 * @return true if the task exists, in which case index is set
	 */
	bool get_index(const std::string & id, unsigned int & index) const;

	const std::vector<Task> & get_tasks() const;

	unsigned int milestone_count() const;
	unsigned int completed_count() const;

	/**
	 * Returns all tasks tagged as critical by their author. This is unrelated
	 * to the computed critical path.
	 */
	std::vector<const Task *> get_critical_tagged_tasks() const;

	/**
	 * Returns the sorted, distinct section labels of all tasks
	 */
	std::vector<std::string> get_sections() const;

	std::vector<const Task *> get_tasks_by_section(const std::string & section) const;

	/**
	 * Returns the existing tasks the given task depends on, in the order of its
	 * dependency list. Unknown IDs are skipped.
	 */
	std::vector<const Task *> get_task_dependencies(const std::string & id) const;

	/**
	 * Returns all tasks that list the given ID as dependency, in plan order
	 */
	std::vector<const Task *> get_task_dependents(const std::string & id) const;

private:
	std::string title;
	Maybe<std::string> description;
	Maybe<date> start_date;
	Maybe<date> end_date;
	std::set<unsigned int> working_days;

	std::vector<Task> tasks;
	// If an ID occurs more than once, the first occurrence wins
	std::unordered_map<std::string, unsigned int> index_by_id;
};

#endif
