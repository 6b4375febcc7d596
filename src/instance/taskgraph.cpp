#include "taskgraph.hpp"

#include "plan.hpp" // for ProjectPlan
#include "task.hpp" // for Task

#include <algorithm>     // for find
#include <cassert>       // for assert
#include <string>        // for string
#include <unordered_set> // for unordered_set

TaskGraph::TaskGraph(const ProjectPlan & plan)
    : edge_counter(0), adj(plan.task_count()), reverse_adj(plan.task_count()),
      initial_in_degree(plan.task_count(), 0)
{
	for (vertex v = 0; v < plan.task_count(); ++v) {
		const Task & task = plan.get_task(v);

		std::unordered_set<std::string> seen;
		for (const auto & dep_id : task.get_dependencies()) {
			if (!seen.insert(dep_id).second) {
				continue; // listed twice
			}

			this->initial_in_degree[v]++;

			vertex dep;
			if (!plan.get_index(dep_id, dep)) {
				continue; // dangling, stays unresolved forever
			}

			this->adj[v].push_back(dep);
			this->edge_counter++;
		}
	}

	// Filling reverse adjacencies vertex by vertex keeps them in plan order
	for (vertex v = 0; v < plan.task_count(); ++v) {
		for (vertex dep : this->adj[v]) {
			this->reverse_adj[dep].push_back(v);
		}
	}

	this->check_consistency();
}

size_t
TaskGraph::vertex_count() const
{
	return this->adj.size();
}

size_t
TaskGraph::edge_count() const
{
	return this->edge_counter;
}

const std::vector<TaskGraph::vertex> &
TaskGraph::dependencies(vertex v) const
{
	return this->adj[v];
}

const std::vector<TaskGraph::vertex> &
TaskGraph::dependents(vertex v) const
{
	return this->reverse_adj[v];
}

unsigned int
TaskGraph::in_degree(vertex v) const
{
	return this->initial_in_degree[v];
}

const std::vector<unsigned int> &
TaskGraph::in_degrees() const
{
	return this->initial_in_degree;
}

#ifdef ENABLE_CONSISTENCY_CHECKS
void
TaskGraph::check_consistency() const
{
	size_t forward = 0;
	size_t backward = 0;

	for (vertex v = 0; v < this->vertex_count(); ++v) {
		forward += this->adj[v].size();
		backward += this->reverse_adj[v].size();

		assert(this->adj[v].size() <= this->initial_in_degree[v]);

		for (vertex dep : this->adj[v]) {
			const auto & back = this->reverse_adj[dep];
			assert(std::find(back.begin(), back.end(), v) != back.end());
			(void)back;
		}
	}

	assert(forward == this->edge_counter);
	assert(backward == this->edge_counter);
	(void)forward;
	(void)backward;
}
#endif
