#include "calendar.hpp"

#include "../manager/errors.hpp"   // for ConfigurationError
#include "../util/fault_codes.hpp" // for FAULT_EMPTY_WORKWEEK

#include <string>

WorkingCalendar::WorkingCalendar(const std::set<unsigned int> & working_days)
{
	this->working.fill(false);

	if (working_days.empty()) {
		throw ConfigurationError("", FAULT_EMPTY_WORKWEEK,
		                         "The working-day set must not be empty");
	}

	for (unsigned int day : working_days) {
		if (day > 6) {
			throw ConfigurationError("", FAULT_INVALID_WEEKDAY,
			                         "Invalid weekday index " +
			                             std::to_string(day) +
			                             ", expected 0 (Monday) to 6 (Sunday)");
		}
		this->working[day] = true;
	}
}

unsigned int
WorkingCalendar::weekday_index(const date & d)
{
	// boost counts from Sunday = 0
	return (static_cast<unsigned int>(d.day_of_week().as_number()) + 6) % 7;
}

bool
WorkingCalendar::is_working_day(const date & d) const
{
	return this->working[weekday_index(d)];
}

WorkingCalendar::date
WorkingCalendar::add_working_days(const date & d, unsigned int n) const
{
	date current = d;
	unsigned int remaining = n;

	while (remaining > 0) {
		current += boost::gregorian::days(1);
		if (this->is_working_day(current)) {
			remaining--;
		}
	}

	return current;
}

WorkingCalendar::date
WorkingCalendar::subtract_working_days(const date & d, unsigned int n) const
{
	date current = d;
	unsigned int remaining = n;

	while (remaining > 0) {
		current -= boost::gregorian::days(1);
		if (this->is_working_day(current)) {
			remaining--;
		}
	}

	return current;
}

unsigned int
WorkingCalendar::count_working_days(const date & start, const date & end) const
{
	if (start > end) {
		return 0;
	}

	unsigned int count = 0;
	for (boost::gregorian::day_iterator it(start); *it <= end; ++it) {
		if (this->is_working_day(*it)) {
			count++;
		}
	}

	return count;
}

std::set<unsigned int>
WorkingCalendar::get_working_days() const
{
	std::set<unsigned int> days;
	for (unsigned int day = 0; day < 7; ++day) {
		if (this->working[day]) {
			days.insert(day);
		}
	}
	return days;
}
