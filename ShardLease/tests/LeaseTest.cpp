#include <gtest/gtest.h>

#include "Lease/Lease.hpp"

using namespace std::chrono_literals;

TEST(LeaseTest, WithoutStampIsExpired)
{
	Lease lease("shard-0001", "foo");
	EXPECT_TRUE(lease.IsExpired(10000ms, SteadyClock::now()));
}

TEST(LeaseTest, ExpiresAtLeaseDuration)
{
	const SteadyTimePoint t0 = SteadyClock::now();
	Lease lease("shard-0001", "foo");
	lease.lastRenewalLocalTime = t0;

	EXPECT_FALSE(lease.IsExpired(1000ms, t0));
	EXPECT_FALSE(lease.IsExpired(1000ms, t0 + 999ms));
	EXPECT_TRUE(lease.IsExpired(1000ms, t0 + 1000ms));
	EXPECT_TRUE(lease.IsExpired(1000ms, t0 + 5s));
}

TEST(LeaseTest, JsonKeepsPersistedFields)
{
	Lease lease("shard-0001", "foo");
	lease.counter = 7;
	lease.concurrencyToken = "abc";
	lease.checkpoint = "seq-42";
	lease.ownerSwitchesSinceCheckpoint = 3;
	lease.lastRenewalLocalTime = SteadyClock::now();

	const Json json = lease.ToJson();
	EXPECT_EQ(json["leaseKey"], "shard-0001");
	EXPECT_EQ(json["leaseOwner"], "foo");
	EXPECT_EQ(json["leaseCounter"], 7);
	EXPECT_FALSE(json.contains("lastRenewalLocalTime"));

	const Lease parsed = Lease::FromJson(json);
	EXPECT_EQ(parsed, lease);
	EXPECT_EQ(parsed.concurrencyToken, "abc");
	EXPECT_FALSE(parsed.lastRenewalLocalTime.has_value());
}

TEST(LeaseTest, NullCheckpointReadsAsAbsent)
{
	Lease lease("shard-0001", "foo");
	lease.concurrencyToken = "abc";
	const Json json = lease.ToJson();
	EXPECT_TRUE(json["checkpoint"].is_null());
	EXPECT_FALSE(Lease::FromJson(json).checkpoint.has_value());
}

TEST(LeaseTest, FromJsonRejectsMissingFields)
{
	const Json json = {{"leaseKey", "shard-0001"}, {"leaseCounter", 1}};
	EXPECT_THROW((void)Lease::FromJson(json), Json::exception);
}

TEST(LeaseTest, EqualityIgnoresTokenAndStamp)
{
	Lease a("shard-0001", "foo");
	a.concurrencyToken = "one";
	a.lastRenewalLocalTime = SteadyClock::now();
	Lease b = a;
	b.concurrencyToken = "two";
	b.lastRenewalLocalTime.reset();
	EXPECT_EQ(a, b);

	b.counter += 1;
	EXPECT_FALSE(a == b);
}

TEST(LeaseTest, CopyIsIndependent)
{
	Lease original("shard-0001", "foo");
	original.checkpoint = "seq-1";
	Lease copy = original;
	copy.checkpoint = "seq-2";
	copy.owner = "bar";
	EXPECT_EQ(original.checkpoint, "seq-1");
	EXPECT_EQ(original.owner, "foo");
}
