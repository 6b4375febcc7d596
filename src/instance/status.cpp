#include "status.hpp"

#include <algorithm>

StatusSet::StatusSet() {}

StatusSet::StatusSet(std::initializer_list<std::string> labels)
{
	for (const auto & label : labels) {
		this->add(label);
	}
}

bool
StatusSet::add(const std::string & label)
{
	if (label == "done") {
		this->set(Tag::DONE);
	} else if (label == "active") {
		this->set(Tag::ACTIVE);
	} else if (label == "crit" || label == "critical") {
		this->set(Tag::CRITICAL);
	} else {
		if (std::find(this->custom.begin(), this->custom.end(), label) ==
		    this->custom.end()) {
			this->custom.push_back(label);
		}
		return false;
	}

	return true;
}

void
StatusSet::set(Tag tag)
{
	this->tags.set(static_cast<size_t>(tag));
}

bool
StatusSet::has(Tag tag) const
{
	return this->tags.test(static_cast<size_t>(tag));
}

const std::vector<std::string> &
StatusSet::get_custom() const
{
	return this->custom;
}

bool
StatusSet::empty() const
{
	return this->tags.none() && this->custom.empty();
}

std::vector<std::string>
StatusSet::labels() const
{
	std::vector<std::string> result;
	for (Tag tag : {Tag::DONE, Tag::ACTIVE, Tag::CRITICAL}) {
		if (this->has(tag)) {
			result.push_back(tag_name(tag));
		}
	}
	result.insert(result.end(), this->custom.begin(), this->custom.end());
	return result;
}

bool
StatusSet::operator==(const StatusSet & other) const
{
	return this->tags == other.tags && this->custom == other.custom;
}

const char *
StatusSet::tag_name(Tag tag)
{
	switch (tag) {
	case Tag::DONE:
		return "done";
	case Tag::ACTIVE:
		return "active";
	case Tag::CRITICAL:
		return "crit";
	}
	return "";
}
