#ifndef STATISTICS_H
#define STATISTICS_H

#include "../datastructures/maybe.hpp" // for Maybe
#include "../util/log.hpp"             // for Log

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <string>
#include <vector>

class ProjectPlan;

struct PlanStatistics {
  unsigned int total_tasks;
  unsigned int completed_tasks;
  unsigned int active_tasks;
  unsigned int critical_tagged_tasks;
  unsigned int milestone_count;
  // in working days, 0 if the plan is not dated
  unsigned int total_duration;
  Maybe<boost::gregorian::date> start_date;
  Maybe<boost::gregorian::date> end_date;
  // percentage of tasks tagged done
  double completion_rate;
  unsigned int critical_path_length;
  std::vector<std::string> sections;
};

/**
 * @brief Aggregates counts and rates over a scheduled plan
 *
 * The critical path length requires a dated, acyclic plan. Reporting on a
 * plan that is not dated raises an InconsistentDataError.
 */
class StatisticsReporter {
public:
  StatisticsReporter(const ProjectPlan & plan);

  PlanStatistics get() const;

private:
  const ProjectPlan & plan;

  Log l;
};

#endif
