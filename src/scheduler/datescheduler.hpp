#ifndef DATESCHEDULER_HPP
#define DATESCHEDULER_HPP

#include "../calendar/calendar.hpp"       // for WorkingCalendar
#include "../datastructures/maybe.hpp"    // for Maybe
#include "../instance/plan.hpp"           // for ProjectPlan
#include "../instance/taskgraph.hpp"      // for TaskGraph
#include "../util/log.hpp"                // for Log

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <string> // for string

/**
 * @brief Computes a fully dated plan from a partially dated one
 *
 * Tasks are visited in dependency order (Kahn's algorithm). When a task is
 * visited, all its dependencies are dated, and the task's missing start date,
 * end date or duration is derived:
 *
 *   1. Milestones get a duration of 0.
 *   2. A task with dated dependencies starts one working day after the latest
 *      dependency end. This overrides any start date given in the input.
 *   3. start + duration gives the end, otherwise start + end gives the
 *      duration, otherwise end + duration gives the start.
 *   4. A task that still has no start starts on the plan's start date, or on
 *      the reference date if the plan has none.
 *
 * The input plan is never modified; the dated plan is a new value. If the
 * dependencies contain a cycle, run() throws a CycleDetectedError and no
 * solution is produced. Dates that would leave the range boost::gregorian
 * supports (1400-01-01 to 9999-12-31) raise an InconsistentDataError.
 */
class DateScheduler {
public:
  using date = boost::gregorian::date;

  /**
   * Constructs a new scheduler for a plan
   *
   * @param plan            The plan that should be dated
   * @param reference_date  The last-resort start date for tasks without any
   *                        time information in a plan without start date. If
   *                        invalid, the current local date is used.
   */
  DateScheduler(const ProjectPlan & plan, Maybe<date> reference_date = Maybe<date>());

  /**
   * Computes the dated plan
   */
  void run();

  /**
   * Returns the dated plan. Before run() has completed, this is an unchanged
   * copy of the input.
   */
  const ProjectPlan & get_solution() const;

  bool has_solution() const;

private:
  void derive_dates(ProjectPlan & working, const TaskGraph & graph,
                    TaskGraph::vertex v);
  void update_plan_dates(ProjectPlan & working) const;
  date get_fallback_start(const ProjectPlan & working);

  // Number of days to add to a start to get the end of a task of the
  // given duration
  static unsigned int span_of(unsigned int duration);

  const ProjectPlan & plan;
  WorkingCalendar calendar;
  Maybe<date> reference_date;

  ProjectPlan solution;
  bool solved;

  Log l;
};

#endif
