#ifndef TASKGRAPH_HPP
#define TASKGRAPH_HPP

#include "generated_config.hpp" // for ENABLE_CONSISTENCY_CHECKS

#include <cstddef>
#include <vector>

class ProjectPlan;

/**
 * @brief The dependency graph of a project plan
 *
 * Vertices are the indices of the tasks in the plan. For every vertex, the
 * graph stores the set of vertices it depends on (forward dependencies), the
 * set of vertices depending on it (reverse dependencies) and its in-degree.
 *
 * The in-degree counts the distinct dependency IDs of a task, including IDs
 * that do not refer to any task in the plan. Such a task can never become
 * ready and therefore shows up as unprocessed in a topological sort.
 *
 * A TaskGraph is a snapshot: it must be rebuilt whenever the task list of the
 * plan changes.
 */
class TaskGraph {
public:
  typedef unsigned int vertex;

  TaskGraph(const ProjectPlan & plan);

  size_t vertex_count() const;
  size_t edge_count() const;

  /**
   * Returns the vertices v depends on, in the order of first appearance in the
   * task's dependency list.
   */
  const std::vector<vertex> & dependencies(vertex v) const;

  /**
   * Returns the vertices that depend on v, in plan order.
   */
  const std::vector<vertex> & dependents(vertex v) const;

  /**
   * Returns the in-degree of v before any vertex has been processed.
   */
  unsigned int in_degree(vertex v) const;

  const std::vector<unsigned int> & in_degrees() const;

#ifdef ENABLE_CONSISTENCY_CHECKS
  void check_consistency() const;
#else
  inline void check_consistency() const {};
#endif

private:
  size_t edge_counter;

  std::vector<std::vector<vertex>> adj;
  std::vector<std::vector<vertex>> reverse_adj;
  std::vector<unsigned int> initial_in_degree;
};

#endif
