#ifndef CONFIGURATION_H
#define CONFIGURATION_H

#include "../datastructures/maybe.hpp" // for Maybe
#include "../util/log.hpp"             // for Log

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <set>    // for set
#include <string> // for string, allocator

class Configuration {
public:
	static Configuration *
	get()
	{
		if (instance == nullptr) {
			instance = new Configuration;
		}
		return instance;
	}

	/**
	 * Parses the command line.
	 *
	 * @return false if the program should exit, either because help was
	 *         requested or because the arguments are invalid
	 */
	bool parse_cmdline(int argc, const char ** argv);

	const std::string & get_plan_file() const;

	const Maybe<std::string> & get_output_file() const;

	const Maybe<boost::gregorian::date> & get_reference_date() const;

	const Maybe<std::set<unsigned int>> & get_working_days() const;

	bool get_validate_only() const;

	Log::severity get_log_level() const;

	Configuration(const Configuration &) = delete;

private:
	Configuration();
	void set_defaults();

	bool parse_working_days(const std::string & text);

	static Configuration * instance;

	// actual options
	std::string plan_file;
	Maybe<std::string> output_file;
	Maybe<boost::gregorian::date> reference_date;
	Maybe<std::set<unsigned int>> working_days;
	bool validate_only;
	Log::severity log_level;

	Log l;
};

#endif
