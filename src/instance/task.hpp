#ifndef TASK_HPP
#define TASK_HPP

#include "../datastructures/maybe.hpp" // for Maybe
#include "status.hpp"                  // for StatusSet

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <string>
#include <vector>

/**
 * @brief A task of a project plan.
 *
 * Each task is associated with a set of attributes:
 *   - An id: Uniquely identifies this task within its plan.
 *   - A name: Used for display only.
 *   - Dependencies: IDs of the tasks that must be finished before this task
 *     starts.
 *   - A start date, an end date and a duration (in working days), each of
 *     which may be unknown. The scheduler derives the unknown ones.
 *   - A milestone flag. Milestones have a duration of 0 and start and end on
 *     the same day.
 *   - Status tags, a section label, a description and an assignee, which are
 *     carried along for reporting.
 */
class Task {
public:
  using date = boost::gregorian::date;

  Task();

  /**
   * Constructs a task without any time information.
   *
   * @param id    The ID of the task, unique within its plan
   * @param name  The display name. If empty, the ID is used.
   */
  Task(std::string id, std::string name = std::string(""));

  const std::string & get_id() const;
  const std::string & get_name() const;
  void set_name(std::string name);

  /**
   * Returns the IDs of the tasks this task depends on, in the order in which
   * they were added.
   */
  const std::vector<std::string> & get_dependencies() const;
  void set_dependencies(std::vector<std::string> dependencies);
  void add_dependency(std::string id);
  bool has_dependencies() const;

  const Maybe<date> & get_start_date() const;
  void set_start_date(Maybe<date> start);

  const Maybe<date> & get_end_date() const;
  void set_end_date(Maybe<date> end);

  /**
   * Returns the duration in working days. 0 denotes a milestone-equivalent
   * duration.
   */
  const Maybe<unsigned int> & get_duration() const;
  void set_duration(Maybe<unsigned int> duration);

  bool is_milestone() const;
  void set_milestone(bool milestone);

  const StatusSet & get_status() const;
  StatusSet & get_status();
  void set_status(StatusSet status);

  const Maybe<std::string> & get_section() const;
  void set_section(Maybe<std::string> section);

  const Maybe<std::string> & get_description() const;
  void set_description(Maybe<std::string> description);

  const Maybe<std::string> & get_assignee() const;
  void set_assignee(Maybe<std::string> assignee);

  /**
   * Returns true if start date, end date and duration are all known.
   */
  bool is_dated() const;

private:
  std::string id;
  std::string name;
  std::vector<std::string> dependencies;

  Maybe<date> start_date;
  Maybe<date> end_date;
  Maybe<unsigned int> duration;
  bool milestone;

  StatusSet status;
  Maybe<std::string> section;
  Maybe<std::string> description;
  Maybe<std::string> assignee;
};

#endif
