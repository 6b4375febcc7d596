#ifndef ERRORS_H
#define ERRORS_H

#include "../util/log.hpp"

#include <exception>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Base class of all errors raised by the scheduling core
 *
 * Carries the title of the plan that was processed, a fault code (see
 * util/fault_codes.hpp), a human readable reason and the backtrace of the
 * point where it was constructed.
 */
class PlanError : public std::exception {
public:
  PlanError(std::string plan_title, int fault_code,
            std::string reason = std::string("")) noexcept;

  virtual unsigned int EXCEPTION_ID() const { return 0 ; };

  const char * what() const noexcept override;

  const std::string & get_plan_title() const;
  std::string get_reason() const;
  int get_fault_code() const;
  const std::vector<std::string> get_backtrace() const;

protected:
  std::string plan_title;
  int fault_code;
  std::string reason;
  std::vector<std::string> bt;
};

/**
 * @brief Not every task could be visited in dependency order
 *
 * The unprocessed tasks form (or depend on) one or more dependency cycles.
 * Any result computed for the run that raised this must be discarded.
 */
class CycleDetectedError : public PlanError {
public:
  CycleDetectedError(std::string plan_title,
                     std::set<std::string> unprocessed_ids) noexcept;

  virtual unsigned int EXCEPTION_ID() const { return 1 ; };

  const std::set<std::string> & get_task_ids() const;

private:
  std::set<std::string> task_ids;
};

class InconsistentDataError : public PlanError {
public:
  InconsistentDataError(std::string plan_title, int fault_code_in,
                        std::string reason = std::string("")) noexcept;

  virtual unsigned int EXCEPTION_ID() const { return 2 ; };
};

class ConfigurationError : public PlanError {
public:
  ConfigurationError(std::string plan_title, int fault_code_in,
                     std::string reason = std::string("")) noexcept;

  virtual unsigned int EXCEPTION_ID() const { return 3 ; };
};

/**
 * @brief Reports errors that reach the command line driver
 */
class ErrorHandler {
public:
  ErrorHandler(std::string input_file);
  void handle(const PlanError &exception);

private:
  std::string input_file;

  Log l;
};

#endif
