#include "configuration.hpp"
#include "../datastructures/maybe.hpp" // for Maybe
#include "log.hpp"                     // for Log

#include <boost/algorithm/string/classification.hpp> // for is_any_of
#include <boost/algorithm/string/split.hpp>          // for split
#include <boost/date_time/gregorian/gregorian.hpp>   // for from_simple_string
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream> // for cout
#include <string>
#include <vector>

namespace po = boost::program_options;

Configuration * Configuration::instance = nullptr;

Configuration::Configuration() : l("CONFIG") { this->set_defaults(); }

void
Configuration::set_defaults()
{
	this->plan_file = "";
	this->output_file = Maybe<std::string>();
	this->reference_date = Maybe<boost::gregorian::date>();
	this->working_days = Maybe<std::set<unsigned int>>();
	this->validate_only = false;
	this->log_level = Log::severity::info;
}

bool
Configuration::parse_cmdline(int argc, const char ** argv)
{
	this->set_defaults();

	po::options_description desc("PlanWeaver Options");

	// clang-format off
    desc.add_options()
    ("help,?", "show a help message")
    ("plan-file,f", po::value<std::string>(), "Specifies the path to a JSON plan file. "
             "The plan is validated, scheduled and analyzed.")
    ("output,o", po::value<std::string>(), "Writes the dated plan, its statistics and its "
             "critical path as JSON to <file>. Without this option, only a summary is logged.")
    ("reference-date,r", po::value<std::string>(), "Tasks without any time information in a "
             "plan without start date start on <date> (YYYY-MM-DD). Defaults to the current "
             "local date.")
    ("working-days,w", po::value<std::string>(), "Comma separated weekday indices that count "
             "as working days, 0 being Monday and 6 being Sunday. Overrides the working days "
             "given in the plan file.")
    ("validate-only,v", "Only validates the plan and reports problems, does not schedule it.")
    ("log-level,l", po::value<std::string>(), "One of debug, info, warning or error. "
             "Defaults to info.")
      ;
	// clang-format on

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
	} catch (const po::error & e) {
		BOOST_LOG(l.e()) << e.what();
		std::cout << desc << "\n";
		return false;
	}

	if (vm.count("help")) {
		std::cout << desc << "\n";
		return false;
	}

	if (vm.count("plan-file")) {
		this->plan_file = vm["plan-file"].as<std::string>();
	} else {
		BOOST_LOG(l.e()) << "You have to specify a plan file.";
		return false;
	}

	if (vm.count("output")) {
		this->output_file = vm["output"].as<std::string>();
	}

	if (vm.count("reference-date")) {
		std::string text = vm["reference-date"].as<std::string>();
		try {
			this->reference_date = boost::gregorian::from_simple_string(text);
		} catch (const std::exception & e) {
			BOOST_LOG(l.e()) << "Invalid reference date '" << text << "': " << e.what();
			return false;
		}
	}

	if (vm.count("working-days")) {
		if (!this->parse_working_days(vm["working-days"].as<std::string>())) {
			return false;
		}
	}

	if (vm.count("validate-only")) {
		this->validate_only = true;
	}

	if (vm.count("log-level")) {
		std::string level = vm["log-level"].as<std::string>();
		if (!Log::parse_severity(level, this->log_level)) {
			BOOST_LOG(l.e()) << "Unknown log level '" << level << "'";
			return false;
		}
	}

	return true;
}

bool
Configuration::parse_working_days(const std::string & text)
{
	std::vector<std::string> parts;
	boost::algorithm::split(parts, text, boost::algorithm::is_any_of(","));

	std::set<unsigned int> days;
	for (const auto & part : parts) {
		try {
			int day = boost::lexical_cast<int>(part);
			if (day < 0 || day > 6) {
				BOOST_LOG(l.e()) << "Working day " << day << " is not within 0 to 6";
				return false;
			}
			days.insert((unsigned int)day);
		} catch (const boost::bad_lexical_cast &) {
			BOOST_LOG(l.e()) << "'" << part << "' is not a weekday index";
			return false;
		}
	}

	if (days.empty()) {
		BOOST_LOG(l.e()) << "At least one working day is required";
		return false;
	}

	this->working_days = days;
	return true;
}

const std::string &
Configuration::get_plan_file() const
{
	return this->plan_file;
}

const Maybe<std::string> &
Configuration::get_output_file() const
{
	return this->output_file;
}

const Maybe<boost::gregorian::date> &
Configuration::get_reference_date() const
{
	return this->reference_date;
}

const Maybe<std::set<unsigned int>> &
Configuration::get_working_days() const
{
	return this->working_days;
}

bool
Configuration::get_validate_only() const
{
	return this->validate_only;
}

Log::severity
Configuration::get_log_level() const
{
	return this->log_level;
}
