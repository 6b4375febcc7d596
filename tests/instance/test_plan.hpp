#ifndef PLANWEAVER_TEST_PLAN_HPP
#define PLANWEAVER_TEST_PLAN_HPP

using namespace testing;

#include "../src/instance/plan.hpp"
#include "../src/instance/status.hpp"
#include "../src/instance/task.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>

namespace test {
namespace instance {

using boost::gregorian::date;

TEST(StatusSetTest, TestRecognizedLabels)
{
	StatusSet status;
	ASSERT_TRUE(status.empty());

	ASSERT_TRUE(status.add("done"));
	ASSERT_TRUE(status.add("critical"));
	ASSERT_FALSE(status.add("on-hold"));

	ASSERT_TRUE(status.has(StatusSet::Tag::DONE));
	ASSERT_FALSE(status.has(StatusSet::Tag::ACTIVE));
	ASSERT_TRUE(status.has(StatusSet::Tag::CRITICAL));
	ASSERT_EQ(status.get_custom(), (std::vector<std::string>{"on-hold"}));
}

TEST(StatusSetTest, TestCritAlias)
{
	StatusSet a{"crit"};
	StatusSet b{"critical"};

	ASSERT_TRUE(a == b);
	ASSERT_EQ(a.labels(), (std::vector<std::string>{"crit"}));
}

TEST(StatusSetTest, TestLabelOrder)
{
	StatusSet status{"later", "crit", "done", "later", "active"};

	ASSERT_EQ(status.labels(),
	          (std::vector<std::string>{"done", "active", "crit", "later"}));
}

TEST(TaskTest, TestNameDefaultsToId)
{
	Task unnamed("T1");
	ASSERT_EQ(unnamed.get_name(), "T1");

	Task named("T2", "Write docs");
	ASSERT_EQ(named.get_name(), "Write docs");
}

TEST(TaskTest, TestIsDated)
{
	Task task("T");
	ASSERT_FALSE(task.is_dated());
	ASSERT_FALSE(task.has_dependencies());

	task.set_start_date(date(2024, 1, 1));
	task.set_end_date(date(2024, 1, 2));
	ASSERT_FALSE(task.is_dated());

	task.set_duration(2u);
	ASSERT_TRUE(task.is_dated());
}

class PlanQueryTest : public Test {
public:
	virtual void
	SetUp()
	{
		Task a("A");
		a.set_section(std::string("Design"));
		a.get_status().add("done");
		plan.add_task(std::move(a));

		Task b("B");
		b.add_dependency("A");
		b.set_section(std::string("Build"));
		b.get_status().add("crit");
		plan.add_task(std::move(b));

		Task c("C");
		c.add_dependency("A");
		c.add_dependency("B");
		c.set_section(std::string("Build"));
		c.set_milestone(true);
		plan.add_task(std::move(c));
	}

protected:
	ProjectPlan plan;
};

TEST_F(PlanQueryTest, TestLookup)
{
	ASSERT_EQ(plan.task_count(), 3u);
	ASSERT_NE(plan.find_task("B"), nullptr);
	ASSERT_EQ(plan.find_task("Z"), nullptr);

	unsigned int index;
	ASSERT_TRUE(plan.get_index("C", index));
	ASSERT_EQ(index, 2u);
	ASSERT_FALSE(plan.get_index("Z", index));
}

TEST_F(PlanQueryTest, TestCounts)
{
	ASSERT_EQ(plan.milestone_count(), 1u);
	ASSERT_EQ(plan.completed_count(), 1u);
	ASSERT_EQ(plan.get_critical_tagged_tasks().size(), 1u);
	ASSERT_EQ(plan.get_critical_tagged_tasks()[0]->get_id(), "B");
}

TEST_F(PlanQueryTest, TestSections)
{
	ASSERT_EQ(plan.get_sections(), (std::vector<std::string>{"Build", "Design"}));

	auto build = plan.get_tasks_by_section("Build");
	ASSERT_EQ(build.size(), 2u);
	ASSERT_EQ(build[0]->get_id(), "B");
	ASSERT_EQ(build[1]->get_id(), "C");
	ASSERT_TRUE(plan.get_tasks_by_section("Test").empty());
}

TEST_F(PlanQueryTest, TestDependencies)
{
	auto deps = plan.get_task_dependencies("C");
	ASSERT_EQ(deps.size(), 2u);
	ASSERT_EQ(deps[0]->get_id(), "A");
	ASSERT_EQ(deps[1]->get_id(), "B");

	auto dependents = plan.get_task_dependents("A");
	ASSERT_EQ(dependents.size(), 2u);
	ASSERT_EQ(dependents[0]->get_id(), "B");
	ASSERT_EQ(dependents[1]->get_id(), "C");

	ASSERT_TRUE(plan.get_task_dependents("C").empty());
	ASSERT_TRUE(plan.get_task_dependencies("Z").empty());
}

} // namespace instance
} // namespace test

#endif
