#ifndef STATUS_HPP
#define STATUS_HPP

#include <bitset>
#include <initializer_list>
#include <string>
#include <vector>

/**
 * @brief The status tags of a task
 *
 * Three tags are recognized: done, active and critical ("crit" is accepted as
 * an alias for critical). Any other label is kept verbatim as a custom label.
 * Tags are only used for reporting, never for scheduling.
 */
class StatusSet {
public:
  enum class Tag : unsigned int
  {
    DONE = 0,
    ACTIVE = 1,
    CRITICAL = 2
  };

  StatusSet();
  StatusSet(std::initializer_list<std::string> labels);

  /**
   * Adds a label. Recognized labels set the corresponding tag, all others
   * are stored as custom labels (each at most once).
   *
   * @return true if the label was recognized
   */
  bool add(const std::string & label);

  void set(Tag tag);
  bool has(Tag tag) const;

  const std::vector<std::string> & get_custom() const;

  bool empty() const;

  /**
   * Returns all labels: recognized tags first (in the order done, active,
   * crit), then custom labels in insertion order.
   */
  std::vector<std::string> labels() const;

  bool operator==(const StatusSet & other) const;

  static const char * tag_name(Tag tag);

private:
  std::bitset<3> tags;
  std::vector<std::string> custom;
};

#endif
