#include <deque>

template <typename visit_func>
void
TopologicalSort::run(visit_func visit)
{
	std::vector<unsigned int> in_degree = this->graph.in_degrees();

	this->order.clear();
	this->order.reserve(this->graph.vertex_count());
	this->processed.assign(this->graph.vertex_count(), false);

	std::deque<vertex> ready;
	for (vertex v = 0; v < this->graph.vertex_count(); ++v) {
		if (in_degree[v] == 0) {
			ready.push_back(v);
		}
	}

	while (!ready.empty()) {
		vertex v = ready.front();
		ready.pop_front();

		if (this->processed[v]) {
			continue;
		}

		visit(v);
		this->processed[v] = true;
		this->order.push_back(v);

		for (vertex dependent : this->graph.dependents(v)) {
			in_degree[dependent]--;
			if (in_degree[dependent] == 0) {
				ready.push_back(dependent);
			}
		}
	}
}
