#ifndef PLANWRITER_H
#define PLANWRITER_H

#include <nlohmann/json.hpp> // for json
#include <string>            // for string
#include <vector>            // for vector

class ProjectPlan;
class Task;
struct PlanStatistics;

/**
 * @brief Serializes a plan into the JSON format read by PlanReader
 *
 * Statistics and the critical path are optional additions; PlanReader
 * ignores them.
 */
class PlanWriter {
public:
  PlanWriter(const ProjectPlan & plan);

  void add_statistics(const PlanStatistics & stats);
  void add_critical_path(const std::vector<const Task *> & critical_path);

  const nlohmann::json & get_json() const;
  void write_to(std::string filename);

private:
  void prepare();
  void dump_tasks();

  const ProjectPlan & plan;
  nlohmann::json j;
};

#endif
