#ifndef PLANWEAVER_TEST_DATESCHEDULER_HPP
#define PLANWEAVER_TEST_DATESCHEDULER_HPP

using namespace testing;

#include "../src/algorithms/graphalgos.hpp"
#include "../src/calendar/calendar.hpp"
#include "../src/instance/plan.hpp"
#include "../src/instance/task.hpp"
#include "../src/manager/errors.hpp"
#include "../src/scheduler/datescheduler.hpp"
#include "../src/util/fault_codes.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

namespace test {
namespace scheduler {

using boost::gregorian::date;

constexpr unsigned int TEST_SEED = 4;
constexpr unsigned int TEST_TASKCOUNT = 60;

/*
 * A: starts Monday 2024-01-01, 5 working days
 * B: depends on A, 3 working days
 * M: milestone, depends on B
 */
ProjectPlan
build_release_plan()
{
	ProjectPlan plan("Release");

	Task a("A", "Design");
	a.set_start_date(date(2024, 1, 1));
	a.set_duration(5u);
	plan.add_task(std::move(a));

	Task b("B", "Build");
	b.add_dependency("A");
	b.set_duration(3u);
	plan.add_task(std::move(b));

	Task m("M", "Ship");
	m.add_dependency("B");
	m.set_milestone(true);
	plan.add_task(std::move(m));

	return plan;
}

ProjectPlan
build_cyclic_plan(const std::vector<std::string> & order)
{
	ProjectPlan plan("Cyclic");
	for (const auto & id : order) {
		Task task(id);
		task.set_duration(1u);
		if (id == "A") {
			task.add_dependency("C");
		} else if (id == "B") {
			task.add_dependency("A");
		} else if (id == "C") {
			task.add_dependency("B");
		}
		plan.add_task(std::move(task));
	}
	return plan;
}

TEST(DateSchedulerTest, TestReleasePlanDates)
{
	ProjectPlan plan = build_release_plan();
	DateScheduler scheduler(plan);
	scheduler.run();

	ASSERT_TRUE(scheduler.has_solution());
	const ProjectPlan & dated = scheduler.get_solution();

	const Task & a = dated.get_task(0);
	ASSERT_EQ(a.get_start_date().value(), date(2024, 1, 1));
	ASSERT_EQ(a.get_end_date().value(), date(2024, 1, 5));

	const Task & b = dated.get_task(1);
	ASSERT_EQ(b.get_start_date().value(), date(2024, 1, 8));
	ASSERT_EQ(b.get_end_date().value(), date(2024, 1, 10));

	const Task & m = dated.get_task(2);
	ASSERT_EQ(m.get_start_date().value(), date(2024, 1, 11));
	ASSERT_EQ(m.get_end_date().value(), date(2024, 1, 11));
	ASSERT_EQ(m.get_duration().value(), 0u);

	ASSERT_EQ(dated.get_start_date().value(), date(2024, 1, 1));
	ASSERT_EQ(dated.get_end_date().value(), date(2024, 1, 11));
}

TEST(DateSchedulerTest, TestReleasePlanCriticalPath)
{
	ProjectPlan plan = build_release_plan();
	DateScheduler scheduler(plan);
	scheduler.run();

	CriticalPathComputer cpc(scheduler.get_solution());
	auto path = cpc.get_critical_path();

	ASSERT_EQ(path.size(), 3u);
	ASSERT_EQ(path[0]->get_id(), "A");
	ASSERT_EQ(path[1]->get_id(), "B");
	ASSERT_EQ(path[2]->get_id(), "M");
}

TEST(DateSchedulerTest, TestInputIsNotModified)
{
	ProjectPlan plan = build_release_plan();
	DateScheduler scheduler(plan);
	scheduler.run();

	ASSERT_FALSE(plan.get_task(1).get_start_date().valid());
	ASSERT_FALSE(plan.get_task(1).get_end_date().valid());
	ASSERT_FALSE(plan.get_task(2).get_duration().valid());
	ASSERT_FALSE(plan.get_end_date().valid());
}

TEST(DateSchedulerTest, TestCycleIsReportedRegardlessOfOrder)
{
	std::vector<std::string> ids = {"A", "B", "C"};
	do {
		ProjectPlan plan = build_cyclic_plan(ids);
		DateScheduler scheduler(plan);

		try {
			scheduler.run();
			FAIL() << "Expected a CycleDetectedError";
		} catch (const CycleDetectedError & e) {
			ASSERT_EQ(e.get_task_ids(), (std::set<std::string>{"A", "B", "C"}));
		}

		ASSERT_FALSE(scheduler.has_solution());
		for (const Task & task : scheduler.get_solution().get_tasks()) {
			ASSERT_FALSE(task.get_start_date().valid());
			ASSERT_FALSE(task.get_end_date().valid());
		}
	} while (std::next_permutation(ids.begin(), ids.end()));
}

TEST(DateSchedulerTest, TestDependencyOverridesInputStart)
{
	ProjectPlan plan = build_release_plan();
	// earlier than A's end
	plan.get_task(1).set_start_date(date(2024, 1, 2));

	DateScheduler scheduler(plan);
	scheduler.run();

	ASSERT_EQ(scheduler.get_solution().get_task(1).get_start_date().value(),
	          date(2024, 1, 8));
}

TEST(DateSchedulerTest, TestMilestoneDurationIsForced)
{
	ProjectPlan plan;
	Task m("M");
	m.set_milestone(true);
	m.set_duration(4u);
	m.set_start_date(date(2024, 1, 3));
	plan.add_task(std::move(m));

	DateScheduler scheduler(plan);
	scheduler.run();

	const Task & dated = scheduler.get_solution().get_task(0);
	ASSERT_EQ(dated.get_duration().value(), 0u);
	ASSERT_EQ(dated.get_start_date().value(), dated.get_end_date().value());
}

TEST(DateSchedulerTest, TestStartFromEndAndDuration)
{
	ProjectPlan plan;
	Task t("T");
	t.set_end_date(date(2024, 1, 9));
	t.set_duration(3u);
	plan.add_task(std::move(t));

	DateScheduler scheduler(plan);
	scheduler.run();

	ASSERT_EQ(scheduler.get_solution().get_task(0).get_start_date().value(),
	          date(2024, 1, 5));
}

TEST(DateSchedulerTest, TestDurationFromStartAndEnd)
{
	ProjectPlan plan;
	Task t("T");
	t.set_start_date(date(2024, 1, 1));
	t.set_end_date(date(2024, 1, 3));
	plan.add_task(std::move(t));

	DateScheduler scheduler(plan);
	scheduler.run();

	// three working days, plus one
	ASSERT_EQ(scheduler.get_solution().get_task(0).get_duration().value(), 4u);
	ASSERT_EQ(scheduler.get_solution().get_task(0).get_end_date().value(),
	          date(2024, 1, 3));
}

TEST(DateSchedulerTest, TestFallbackToPlanStart)
{
	ProjectPlan plan;
	plan.set_start_date(date(2024, 2, 5));
	Task t("T");
	t.set_duration(2u);
	plan.add_task(std::move(t));

	DateScheduler scheduler(plan, date(2030, 1, 1));
	scheduler.run();

	const Task & dated = scheduler.get_solution().get_task(0);
	ASSERT_EQ(dated.get_start_date().value(), date(2024, 2, 5));
	ASSERT_EQ(dated.get_end_date().value(), date(2024, 2, 6));
}

TEST(DateSchedulerTest, TestFallbackToReferenceDate)
{
	ProjectPlan plan;
	plan.add_task(Task("T"));

	DateScheduler scheduler(plan, date(2024, 3, 4));
	scheduler.run();

	const Task & dated = scheduler.get_solution().get_task(0);
	ASSERT_EQ(dated.get_start_date().value(), date(2024, 3, 4));
	ASSERT_FALSE(dated.get_end_date().valid());
}

TEST(DateSchedulerTest, TestEmptyPlan)
{
	ProjectPlan plan;
	DateScheduler scheduler(plan);
	scheduler.run();

	ASSERT_TRUE(scheduler.has_solution());
	ASSERT_EQ(scheduler.get_solution().task_count(), 0u);
	ASSERT_FALSE(scheduler.get_solution().get_start_date().valid());
}

TEST(DateSchedulerTest, TestCustomWorkweek)
{
	ProjectPlan plan = build_release_plan();
	plan.set_working_days({0, 1, 2, 3, 4, 5});

	DateScheduler scheduler(plan);
	scheduler.run();

	// Saturday is worked, A ends on Friday, B starts on Saturday
	ASSERT_EQ(scheduler.get_solution().get_task(0).get_end_date().value(),
	          date(2024, 1, 5));
	ASSERT_EQ(scheduler.get_solution().get_task(1).get_start_date().value(),
	          date(2024, 1, 6));
}

TEST(DateSchedulerTest, TestDatesBeyondCalendarRange)
{
	ProjectPlan plan("Far future");
	Task a("A");
	a.set_start_date(date(9999, 12, 29));
	a.set_duration(5u);
	plan.add_task(std::move(a));

	DateScheduler scheduler(plan);
	try {
		scheduler.run();
		FAIL() << "Expected an InconsistentDataError";
	} catch (const InconsistentDataError & e) {
		ASSERT_EQ(e.get_fault_code(), FAULT_DATE_OUT_OF_RANGE);
		ASSERT_EQ(e.get_plan_title(), "Far future");
	}

	ASSERT_FALSE(scheduler.has_solution());
	ASSERT_FALSE(scheduler.get_solution().get_task(0).get_end_date().valid());
}

TEST(DateSchedulerTest, TestDependentBeyondCalendarRange)
{
	ProjectPlan plan;
	Task a("A");
	a.set_end_date(date(9999, 12, 31));
	a.set_duration(1u);
	plan.add_task(std::move(a));

	Task b("B");
	b.add_dependency("A");
	b.set_duration(1u);
	plan.add_task(std::move(b));

	DateScheduler scheduler(plan);
	ASSERT_THROW(scheduler.run(), InconsistentDataError);
}

/*
 * Randomized plans
 */

class RandomPlanTest : public Test {
public:
	virtual void
	SetUp()
	{
		std::mt19937 rng(TEST_SEED);
		std::uniform_int_distribution<unsigned int> duration_dist(0, 8);
		std::uniform_int_distribution<unsigned int> dep_count_dist(0, 3);
		std::bernoulli_distribution milestone_dist(0.1);

		plan.set_start_date(date(2024, 1, 1));

		for (unsigned int i = 0; i < TEST_TASKCOUNT; ++i) {
			Task task("T" + std::to_string(i));

			if (milestone_dist(rng)) {
				task.set_milestone(true);
			} else {
				task.set_duration(duration_dist(rng));
			}

			if (i > 0) {
				std::uniform_int_distribution<unsigned int> dep_dist(0, i - 1);
				unsigned int dep_count = dep_count_dist(rng);
				for (unsigned int j = 0; j < dep_count; ++j) {
					task.add_dependency("T" + std::to_string(dep_dist(rng)));
				}
			}

			plan.add_task(std::move(task));
		}
	}

protected:
	ProjectPlan plan;
};

TEST_F(RandomPlanTest, TestDependencyOrdering)
{
	DateScheduler scheduler(plan);
	scheduler.run();
	const ProjectPlan & dated = scheduler.get_solution();
	WorkingCalendar cal(dated.get_working_days());

	for (const Task & task : dated.get_tasks()) {
		for (const Task * dep : dated.get_task_dependencies(task.get_id())) {
			ASSERT_GE(task.get_start_date().value(),
			          cal.add_working_days(dep->get_end_date().value(), 1));
		}
	}
}

TEST_F(RandomPlanTest, TestMilestones)
{
	DateScheduler scheduler(plan);
	scheduler.run();

	for (const Task & task : scheduler.get_solution().get_tasks()) {
		if (task.is_milestone()) {
			ASSERT_EQ(task.get_duration().value(), 0u);
			ASSERT_EQ(task.get_start_date().value(), task.get_end_date().value());
		}
	}
}

TEST_F(RandomPlanTest, TestIdempotence)
{
	DateScheduler first(plan);
	first.run();
	ProjectPlan once = first.get_solution();

	DateScheduler second(once);
	second.run();
	const ProjectPlan & twice = second.get_solution();

	ASSERT_EQ(once.task_count(), twice.task_count());
	for (unsigned int i = 0; i < once.task_count(); ++i) {
		ASSERT_TRUE(once.get_task(i).is_dated());
		ASSERT_EQ(once.get_task(i).get_start_date(), twice.get_task(i).get_start_date());
		ASSERT_EQ(once.get_task(i).get_end_date(), twice.get_task(i).get_end_date());
		ASSERT_EQ(once.get_task(i).get_duration(), twice.get_task(i).get_duration());
	}
	ASSERT_EQ(once.get_start_date(), twice.get_start_date());
	ASSERT_EQ(once.get_end_date(), twice.get_end_date());
}

} // namespace scheduler
} // namespace test

#endif
