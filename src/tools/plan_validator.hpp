#ifndef PLAN_VALIDATOR_H
#define PLAN_VALIDATOR_H

#include "../util/log.hpp" // for Log

#include <string>
#include <vector>

class ProjectPlan;

/**
 * @brief A problem found in a plan. Diagnostics are reported, never thrown.
 */
struct Diagnostic {
  enum class Kind
  {
    EMPTY_PLAN,
    MISSING_TIME_INFORMATION,
    START_AFTER_END,
    DEPENDENCY_CYCLE
  };

  Kind kind;
  // empty for plan-wide diagnostics
  std::string task_id;
  std::string message;
};

/**
 * @brief Checks a plan for structural and date-logic problems
 *
 * The validator does not modify the plan and may be used before or after
 * scheduling. An empty result means that no blocking problem was found. It
 * does not mean that every task will end up with an end date.
 */
class PlanValidator {
public:
  PlanValidator(const ProjectPlan & plan);

  std::vector<Diagnostic> validate() const;

private:
  void check_tasks(std::vector<Diagnostic> & diagnostics) const;
  void check_cycles(std::vector<Diagnostic> & diagnostics) const;

  const ProjectPlan & plan;

  Log l;
};

#endif
