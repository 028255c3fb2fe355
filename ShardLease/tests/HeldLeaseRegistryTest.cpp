#include <gtest/gtest.h>

#include "Lease/HeldLeaseRegistry.hpp"

using namespace std::chrono_literals;

namespace
{
Lease Stamped(const std::string& key, const std::string& token)
{
	Lease lease(key, "foo");
	lease.concurrencyToken = token;
	lease.lastRenewalLocalTime = SteadyClock::now();
	return lease;
}

class HeldLeaseRegistryTest : public ::testing::Test
{
   protected:
	const SteadyTimePoint t0 = SteadyClock::now();
	HeldLeaseRegistry registry{std::make_shared<Log>("HeldLeaseRegistryTest")};
};
}  // namespace

TEST_F(HeldLeaseRegistryTest, AddSkipsUnstampedLeases)
{
	Lease unstamped("2", "foo");
	EXPECT_EQ(registry.Add({Stamped("1", "a"), unstamped}, t0), 1u);
	EXPECT_EQ(registry.Size(), 1u);
	EXPECT_FALSE(registry.Find("2").has_value());
	// Restamped with the registry's now.
	EXPECT_EQ(registry.Find("1")->lastRenewalLocalTime, t0);
}

TEST_F(HeldLeaseRegistryTest, ReadsFilterExpired)
{
	registry.Add({Stamped("1", "a")}, t0);
	registry.Add({Stamped("2", "b")}, t0 + 500ms);

	EXPECT_TRUE(registry.Get("1", 1000ms, t0 + 900ms).has_value());
	EXPECT_FALSE(registry.Get("1", 1000ms, t0 + 1000ms).has_value());

	const auto live = registry.GetAll(1000ms, t0 + 1200ms);
	EXPECT_EQ(live.size(), 1u);
	EXPECT_TRUE(live.contains("2"));

	// Expired entries stay until something evicts them.
	EXPECT_EQ(registry.Snapshot().size(), 2u);
	EXPECT_TRUE(registry.Find("1").has_value());
}

TEST_F(HeldLeaseRegistryTest, ReturnsCopies)
{
	registry.Add({Stamped("1", "a")}, t0);
	auto copy = registry.Find("1");
	copy->checkpoint = "changed";
	auto all = registry.GetAll(1000ms, t0);
	all.at("1").counter = 99;

	EXPECT_FALSE(registry.Find("1")->checkpoint.has_value());
	EXPECT_EQ(registry.Find("1")->counter, 0);
}

TEST_F(HeldLeaseRegistryTest, ApplyIfTokenIsCompareAndSet)
{
	registry.Add({Stamped("1", "a")}, t0);

	EXPECT_FALSE(registry.ApplyIfToken("1", "stale", [](Lease& lease) { lease.counter = 5; }));
	EXPECT_FALSE(registry.ApplyIfToken("missing", "a", [](Lease& lease) { lease.counter = 5; }));
	EXPECT_EQ(registry.Find("1")->counter, 0);

	EXPECT_TRUE(registry.ApplyIfToken("1", "a",
									  [](Lease& lease)
									  {
										  lease.counter = 1;
										  lease.concurrencyToken = "b";
									  }));
	EXPECT_EQ(registry.Find("1")->counter, 1);
	// The old token no longer matches.
	EXPECT_FALSE(registry.RemoveIfToken("1", "a"));
	EXPECT_TRUE(registry.RemoveIfToken("1", "b"));
	EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(HeldLeaseRegistryTest, ThrowingMutationLeavesEntryIntact)
{
	registry.Add({Stamped("1", "a")}, t0);
	EXPECT_THROW(registry.ApplyIfToken("1", "a",
									   [](Lease& lease)
									   {
										   lease.counter = 42;
										   throw std::runtime_error("boom");
									   }),
				 std::runtime_error);
	EXPECT_EQ(registry.Find("1")->counter, 0);
}

TEST_F(HeldLeaseRegistryTest, RemoveAndClear)
{
	registry.Add({Stamped("1", "a"), Stamped("2", "b"), Stamped("3", "c")}, t0);
	EXPECT_TRUE(registry.Remove("1"));
	EXPECT_FALSE(registry.Remove("1"));
	EXPECT_EQ(registry.Size(), 2u);
	registry.Clear();
	EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(HeldLeaseRegistryTest, WriteGateOutlivesEntry)
{
	const auto gate = registry.WriteGate("1");
	EXPECT_EQ(registry.WriteGate("1"), gate);
	EXPECT_NE(registry.WriteGate("2"), gate);

	registry.Add({Stamped("1", "a")}, t0);
	registry.Clear();
	EXPECT_EQ(registry.WriteGate("1"), gate);
}

TEST_F(HeldLeaseRegistryTest, UnusedWriteGatesArePruned)
{
	registry.Add({Stamped("1", "a"), Stamped("2", "b"), Stamped("3", "c")}, t0);
	for (const std::string key : {"1", "2", "3"})
	{
		std::scoped_lock gateLock(*registry.WriteGate(key));
	}
	EXPECT_EQ(registry.WriteGateCount(), 3u);

	EXPECT_TRUE(registry.Remove("1"));
	EXPECT_EQ(registry.WriteGateCount(), 2u);

	registry.Clear();
	EXPECT_EQ(registry.WriteGateCount(), 0u);
}

TEST_F(HeldLeaseRegistryTest, HeldWriteGateSurvivesEvictionUntilReleased)
{
	registry.Add({Stamped("1", "a"), Stamped("2", "b")}, t0);
	{
		const auto gate = registry.WriteGate("1");
		std::scoped_lock gateLock(*gate);
		EXPECT_TRUE(registry.RemoveIfToken("1", "a"));
		EXPECT_EQ(registry.WriteGateCount(), 1u);
		EXPECT_EQ(registry.PruneWriteGates(), 0u);
	}
	// Still held leases keep their gate even when idle.
	(void)registry.WriteGate("2");
	EXPECT_EQ(registry.PruneWriteGates(), 1u);
	EXPECT_EQ(registry.WriteGateCount(), 1u);
}
