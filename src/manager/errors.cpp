#include "errors.hpp"
#include "../util/fault_codes.hpp"
#include "../util/log.hpp"          // for Log
#include <execinfo.h> // for backtrace
#include <sstream>
#include <stdlib.h>   // for free, size_t
#include <string>     // for string
#include <vector>     // for vector

#define BACKTRACE_SIZE 500

namespace {

std::string
describe_cycle(const std::set<std::string> & ids)
{
	std::ostringstream msg;
	msg << "Dependency cycle detected, involving tasks: {";
	bool first = true;
	for (const auto & id : ids) {
		if (!first) {
			msg << ", ";
		}
		msg << id;
		first = false;
	}
	msg << "}";
	return msg.str();
}

} // namespace

PlanError::PlanError(std::string plan_title_in, int fault_code_in,
                     std::string reason_in) noexcept
    : plan_title(std::move(plan_title_in)), fault_code(fault_code_in),
      reason(std::move(reason_in))
{
	void * backtrace_buffer[BACKTRACE_SIZE];
	size_t trace_size = (size_t)backtrace(backtrace_buffer, BACKTRACE_SIZE);

	char ** messages = backtrace_symbols(backtrace_buffer, (int)trace_size);

	if (messages != nullptr) {
		/* skip first stack frame (points here) */
		for (size_t i = 1; i < trace_size; ++i) {
			bt.push_back(messages[i]);
		}
		free(messages);
	}
}

CycleDetectedError::CycleDetectedError(std::string plan_title_in,
                                       std::set<std::string> unprocessed_ids) noexcept
    : PlanError(std::move(plan_title_in), FAULT_CYCLE_DETECTED,
                describe_cycle(unprocessed_ids)),
      task_ids(std::move(unprocessed_ids))
{}

InconsistentDataError::InconsistentDataError(std::string plan_title_in,
                                             int fault_code_in,
                                             std::string reason_in) noexcept
    : PlanError(std::move(plan_title_in), fault_code_in, std::move(reason_in))
{}

ConfigurationError::ConfigurationError(std::string plan_title_in,
                                       int fault_code_in,
                                       std::string reason_in) noexcept
    : PlanError(std::move(plan_title_in), fault_code_in, std::move(reason_in))
{}

const std::set<std::string> &
CycleDetectedError::get_task_ids() const
{
	return this->task_ids;
}

const char *
PlanError::what() const noexcept
{
	return this->reason.c_str();
}

const std::string &
PlanError::get_plan_title() const
{
	return this->plan_title;
}

std::string
PlanError::get_reason() const
{
	return this->reason;
}

int
PlanError::get_fault_code() const
{
	return this->fault_code;
}

const std::vector<std::string>
PlanError::get_backtrace() const
{
	return this->bt;
}

ErrorHandler::ErrorHandler(std::string input_file_in)
    : input_file(std::move(input_file_in)), l("ERRHANDLE")
{}

void
ErrorHandler::handle(const PlanError & exception)
{
	BOOST_LOG(l.e()) << "===========================================";
	BOOST_LOG(l.e()) << "   Scheduling failed.";
	BOOST_LOG(l.e()) << " Error ID:      " << exception.EXCEPTION_ID();
	BOOST_LOG(l.e()) << " Plan:          " << exception.get_plan_title();
	BOOST_LOG(l.e()) << " Input:         " << this->input_file;
	BOOST_LOG(l.e()) << " Message:       " << exception.get_reason();
	BOOST_LOG(l.e()) << " Fault Code:    " << exception.get_fault_code();
	BOOST_LOG(l.e()) << "===========================================";
	BOOST_LOG(l.d()) << " Printing a backtrace now:";
	for (const auto & msg : exception.get_backtrace()) {
		BOOST_LOG(l.d()) << msg;
	}
	BOOST_LOG(l.d()) << "===========================================";
}
