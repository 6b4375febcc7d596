#ifndef CALENDAR_HPP
#define CALENDAR_HPP

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <array>
#include <set>

/**
 * @brief Working-day arithmetic over a fixed weekly pattern
 *
 * Weekdays are indexed 0 (Monday) to 6 (Sunday). A day is a working day iff
 * its weekday index is part of the pattern. The calendar holds no other
 * state; all operations are pure.
 */
class WorkingCalendar {
public:
  using date = boost::gregorian::date;

  /**
   * Constructs a calendar from a set of working weekday indices.
   *
   * Throws a ConfigurationError if the set is empty or contains an index
   * larger than 6.
   *
   * @param working_days  The weekday indices (0 = Monday) that are worked
   */
  explicit WorkingCalendar(const std::set<unsigned int> & working_days);

  /**
   * Returns the weekday index of a date, 0 being Monday and 6 being Sunday.
   */
  static unsigned int weekday_index(const date & d);

  bool is_working_day(const date & d) const;

  /**
   * Steps forward from d one calendar day at a time until n working days
   * have been landed on. d itself is never counted, so adding 0 returns d.
   *
   * A task of duration k that starts on s ends on add_working_days(s, k - 1).
   */
  date add_working_days(const date & d, unsigned int n) const;

  /**
   * Like add_working_days, stepping backward.
   */
  date subtract_working_days(const date & d, unsigned int n) const;

  /**
   * Number of working days within [start, end], both ends included. Returns
   * 0 if start lies after end.
   */
  unsigned int count_working_days(const date & start, const date & end) const;

  std::set<unsigned int> get_working_days() const;

private:
  std::array<bool, 7> working;
};

#endif
