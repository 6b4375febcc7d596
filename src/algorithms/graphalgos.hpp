#ifndef GRAPHALGOS_H
#define GRAPHALGOS_H

#include "../calendar/calendar.hpp"   // for WorkingCalendar
#include "../instance/taskgraph.hpp"  // for TaskGraph, TaskGraph::vertex
#include "../util/log.hpp"            // for Log

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <set>
#include <string>
#include <vector>

class ProjectPlan;
class Task;

/**
 * @brief Kahn's algorithm over a TaskGraph
 *
 * Vertices with in-degree 0 are visited first, in plan order. After that,
 * vertices are visited in the order in which they became ready (FIFO). A
 * vertex that never becomes ready is left unprocessed; after a run, a
 * non-empty unprocessed set means the graph has a dependency cycle (or a
 * dangling dependency).
 */
class TopologicalSort
{
public:
  using vertex = TaskGraph::vertex;

  TopologicalSort(const TaskGraph & graph);

  /**
   * Runs the sort, calling visit(v) for every vertex at the moment it is
   * popped from the ready queue. When visit is called, all dependencies of v
   * have been visited already.
   */
  template <typename visit_func>
  void run(visit_func visit);

  /**
   * Runs the sort without a visitor and returns the visiting order. On a
   * cyclic graph the order does not contain all vertices.
   */
  std::vector<vertex> get();

  bool is_complete() const;
  std::vector<vertex> get_unprocessed() const;

private:
  const TaskGraph & graph;

  std::vector<vertex> order;
  std::vector<bool> processed;
};

/**
 * @brief Checks a plan for dependency cycles without computing any dates
 */
class CycleDetector
{
public:
  CycleDetector(const ProjectPlan & plan);

  bool has_cycle() const;

  /**
   * Returns the IDs of all tasks that could not be ordered
   */
  const std::set<std::string> & get_unprocessed_ids() const;

  /**
   * Throws a CycleDetectedError if the plan contains a cycle
   */
  void check() const;

private:
  const ProjectPlan & plan;
  std::set<std::string> unprocessed_ids;
};

/**
 * @brief Critical path method on a dated plan
 *
 * The forward pass computes, in topological order, the earliest start of
 * every task: its own start date if it has no dependencies, one working day
 * after the latest dependency end otherwise. The backward pass computes, in
 * reverse topological order, the latest start: the earliest start for tasks
 * without dependents, otherwise the minimum over all dependents of the
 * dependent's latest start minus this task's duration (in working days).
 *
 * Tasks whose earliest and latest start coincide have zero slack and form the
 * critical path.
 */
class CriticalPathComputer
{
public:
  using date = boost::gregorian::date;
  using vertex = TaskGraph::vertex;

  /**
   * Throws a CycleDetectedError if the plan is cyclic and an
   * InconsistentDataError if any task has no start date.
   */
  CriticalPathComputer(const ProjectPlan & plan);

  /**
   * Returns the earliest start of every task, indexed like the plan's tasks
   */
  const std::vector<date> & get_forward() const;

  /**
   * Returns the latest start of every task, indexed like the plan's tasks
   */
  const std::vector<date> & get_reverse() const;

  /**
   * Returns all zero-slack tasks, in topological order
   */
  std::vector<const Task *> get_critical_path() const;

  /**
   * Returns the slack of task i in working days. The slack is negative if
   * the task's latest start lies before its earliest start, which happens
   * when its end date and its duration disagree.
   */
  int get_slack(vertex i) const;

private:
  void compute_forward();
  void compute_reverse();

  Log l;

  const ProjectPlan & plan;
  WorkingCalendar calendar;
  TaskGraph graph;
  std::vector<vertex> topological_order;

  std::vector<date> earliest_start;
  std::vector<date> latest_start;
};

#include "graphalgos_templates.cpp"

#endif
