#ifndef PLANREADER_H
#define PLANREADER_H

#include "../datastructures/maybe.hpp" // for Maybe
#include "../instance/plan.hpp"        // for ProjectPlan
#include "../util/log.hpp"             // for Log

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <nlohmann/json.hpp> // for json
#include <stdexcept>         // for runtime_error
#include <string>

class Task;

class PlanMalformedException : public std::runtime_error {
public:
	explicit PlanMalformedException(const std::string & what);
};

/**
 * @brief Builds a ProjectPlan from its JSON representation
 *
 * Besides converting the data, the reader enforces the invariants every plan
 * must satisfy before it can be scheduled: task IDs are unique and every
 * dependency refers to a task of the same plan. Violations raise a
 * PlanMalformedException.
 */
class PlanReader {
public:
	/**
	 * The largest accepted task duration, in working days. With five working
	 * days a week this is roughly 400 years, which keeps every plan that starts
	 * after 1600 inside the supported calendar range.
	 */
	static constexpr unsigned int MAX_DURATION = 100000;

	PlanReader(std::string filename);
	PlanReader(nlohmann::json js);

	ProjectPlan parse();

private:
	Maybe<std::string> filename;
	nlohmann::json js;

	void read_file();
	void parse_header(ProjectPlan & plan);
	void parse_tasks(ProjectPlan & plan);
	Task parse_task(const nlohmann::json & task_data);
	void check_references(const ProjectPlan & plan);

	Maybe<boost::gregorian::date> get_date(const nlohmann::json & js_in,
	                                       const char * key);
	Maybe<std::string> get_optional_string(const nlohmann::json & js_in,
	                                       const char * key);

	template <class T>
	T
	get_json(const char * key, const nlohmann::json & js_in)
	{
		try {
			return js_in.at(key).get<T>();
		} catch (const nlohmann::json::out_of_range &) {
			BOOST_LOG(l.e()) << "Got an error trying to access " << key;
			throw PlanMalformedException(std::string("Missing key '") + key + "'");
		} catch (const nlohmann::json::type_error & e) {
			BOOST_LOG(l.e()) << "JSON type error:";
			BOOST_LOG(l.e()) << e.what();
			BOOST_LOG(l.e()) << "Error during access of key '" << key << "'";

			throw PlanMalformedException(std::string("Wrong type for key '") + key +
			                             "'");
		}
	}

	Log l;
};

#endif
