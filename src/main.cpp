#include "algorithms/graphalgos.hpp"  // for CriticalPathComputer
#include "datastructures/maybe.hpp"   // for Maybe
#include "generated_config.hpp"       // for PLANWEAVER_VERSION
#include "instance/plan.hpp"          // for ProjectPlan
#include "io/planreader.hpp"          // for PlanReader, PlanMalformedException
#include "io/planwriter.hpp"          // for PlanWriter
#include "manager/errors.hpp"         // for PlanError, ErrorHandler
#include "scheduler/datescheduler.hpp" // for DateScheduler
#include "tools/plan_validator.hpp"   // for PlanValidator, Diagnostic
#include "tools/statistics.hpp"       // for StatisticsReporter
#include "util/configuration.hpp"     // for Configuration
#include "util/log.hpp"               // for Log

#include <boost/date_time/gregorian/gregorian.hpp> // for operator<<
#include <boost/log/sources/record_ostream.hpp>    // for basic_rec...
#include <exception>                               // for exception
#include <stdexcept>                               // for runtime_error
#include <string>                                  // for string
#include <vector>                                  // for vector

#define EXIT_MALFORMED_INPUT 1
#define EXIT_SCHEDULING_FAILED 2
#define EXIT_VALIDATION_FAILED 3

namespace {

void
log_summary(const Log & l, const ProjectPlan & plan, const PlanStatistics & stats,
            const std::vector<const Task *> & critical_path)
{
	BOOST_LOG(l.i()) << "Plan '" << plan.get_title() << "': " << stats.total_tasks
	                 << " tasks, " << stats.milestone_count << " milestones, "
	                 << stats.completed_tasks << " done, " << stats.active_tasks
	                 << " active";
	if (stats.start_date.valid() && stats.end_date.valid()) {
		BOOST_LOG(l.i()) << "Runs from " << stats.start_date.value() << " to "
		                 << stats.end_date.value() << " (" << stats.total_duration
		                 << " working days)";
	}
	BOOST_LOG(l.i()) << "Completion rate: " << stats.completion_rate << "%";

	std::string path;
	for (const Task * task : critical_path) {
		if (!path.empty()) {
			path += " -> ";
		}
		path += task->get_id();
	}
	BOOST_LOG(l.i()) << "Critical path (" << stats.critical_path_length
	                 << " tasks): " << path;
}

} // namespace

int
main(int argc, const char ** argv)
{
	// Set up console logging
	Log::setup();
	Log l("MAIN");

	Configuration & cfg = *Configuration::get();
	if (!cfg.parse_cmdline(argc, argv)) {
		return 1;
	}
	Log::set_min_severity(cfg.get_log_level());

	BOOST_LOG(l.d(1)) << "PlanWeaver " << PLANWEAVER_VERSION << " starting up.";

	ProjectPlan plan;
	try {
		PlanReader reader(cfg.get_plan_file());
		plan = reader.parse();
	} catch (const PlanMalformedException & e) {
		BOOST_LOG(l.e()) << "Could not read " << cfg.get_plan_file() << ": "
		                 << e.what();
		return EXIT_MALFORMED_INPUT;
	}
	BOOST_LOG(l.i()) << "Read plan '" << plan.get_title() << "' with "
	                 << plan.task_count() << " tasks";

	if (cfg.get_working_days().valid()) {
		plan.set_working_days(cfg.get_working_days().value());
	}

	PlanValidator validator(plan);
	std::vector<Diagnostic> diagnostics = validator.validate();
	for (const auto & diagnostic : diagnostics) {
		BOOST_LOG(l.w()) << diagnostic.message;
	}

	if (cfg.get_validate_only()) {
		if (diagnostics.empty()) {
			BOOST_LOG(l.i()) << "No problems found.";
			return 0;
		}
		BOOST_LOG(l.i()) << diagnostics.size() << " problems found.";
		return EXIT_VALIDATION_FAILED;
	}

	ErrorHandler handler(cfg.get_plan_file());
	try {
		DateScheduler scheduler(plan, cfg.get_reference_date());
		scheduler.run();
		const ProjectPlan & dated = scheduler.get_solution();

		CriticalPathComputer cpc(dated);
		std::vector<const Task *> critical_path = cpc.get_critical_path();
		PlanStatistics stats = StatisticsReporter(dated).get();

		log_summary(l, dated, stats, critical_path);

		if (cfg.get_output_file().valid()) {
			PlanWriter writer(dated);
			writer.add_statistics(stats);
			writer.add_critical_path(critical_path);
			writer.write_to(cfg.get_output_file().value());
			BOOST_LOG(l.i()) << "Wrote " << cfg.get_output_file().value();
		}
	} catch (const PlanError & e) {
		handler.handle(e);
		return EXIT_SCHEDULING_FAILED;
	} catch (const std::runtime_error & e) {
		BOOST_LOG(l.e()) << e.what();
		return EXIT_MALFORMED_INPUT;
	}

	BOOST_LOG(l.i()) << "Finished normally";
	return 0;
}
