#ifndef MAYBE_H
#define MAYBE_H

#include <utility>

/**
 * @brief A value that may or may not be known
 *
 * Used for every optional field of the plan model (dates, durations, labels).
 * An invalid Maybe still holds a default-constructed T, so T must be
 * default-constructible.
 */
template <class T>
class Maybe {
public:
	Maybe(T val_in) : val(std::move(val_in)), is_valid(true) {}

	Maybe() : val(), is_valid(false) {}

	bool
	valid() const
	{
		return this->is_valid;
	}

	T &
	value()
	{
		return this->val;
	}

	const T &
	value() const
	{
		return this->val;
	}

	operator const T &() const
	{
		return this->val;
	}

	const T &
	value_or_default(const T & def) const
	{
		if (this->is_valid) {
			return this->val;
		} else {
			return def;
		}
	}

	// Two invalid Maybes are equal regardless of the value they hold
	bool
	operator==(const Maybe<T> & other) const
	{
		if (this->is_valid != other.is_valid) {
			return false;
		}
		return !this->is_valid || (this->val == other.val);
	}

	bool
	operator!=(const Maybe<T> & other) const
	{
		return !(*this == other);
	}

private:
	T val;
	bool is_valid;
};

#endif
