#pragma once
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "Lease/LeaseRenewer.hpp"
#include "Lease/Store/InMemoryLeaseStore.hpp"

// Steady clock the test moves by hand.
class ManualClock
{
	const SteadyTimePoint base = SteadyClock::now();
	std::atomic<int64_t> offsetNs = 0;

   public:
	[[nodiscard]] SteadyTimePoint Now() const
	{
		return base + std::chrono::nanoseconds(offsetNs.load());
	}
	void Advance(std::chrono::nanoseconds by) { offsetNs += by.count(); }
	[[nodiscard]] SteadyNowFn AsFn()
	{
		return [this] { return Now(); };
	}
};

inline LeaseRenewerSettings MakeSettings(const std::string& owner,
										 std::chrono::milliseconds leaseDuration)
{
	LeaseRenewerSettings settings;
	settings.workerIdentifier = owner;
	settings.leaseDuration = leaseDuration;
	settings.renewalPassTimeout = std::min(leaseDuration, std::chrono::milliseconds(2000));
	settings.maxRenewalThreads = 4;
	return settings;
}

// Seeds a store with leases and drives a renewer the way a worker would.
class LeaseTestHarness
{
   public:
	explicit LeaseTestHarness(std::shared_ptr<InMemoryLeaseStore> inStore)
		: store(std::move(inStore))
	{
	}

	LeaseTestHarness& WithLease(const std::string& key, const std::string& owner)
	{
		pending.emplace_back(key, owner);
		return *this;
	}

	std::unordered_map<std::string, Lease> Build()
	{
		std::unordered_map<std::string, Lease> built;
		for (const auto& lease : pending)
		{
			EXPECT_TRUE(store->CreateLeaseIfNotExists(lease));
			built.emplace(lease.key, *store->GetLease(lease.key));
		}
		pending.clear();
		return built;
	}

	// Reads the current store copy of each key and hands it to the renewer as
	// freshly acquired.
	void AddLeasesToRenew(LeaseRenewer& renewer, std::initializer_list<std::string> keys)
	{
		std::vector<Lease> leases;
		for (const auto& key : keys)
		{
			auto lease = store->GetLease(key);
			ASSERT_TRUE(lease.has_value()) << key;
			lease->lastRenewalLocalTime = SteadyClock::now();
			leases.push_back(*lease);
		}
		renewer.AddLeasesToRenew(leases);
	}

	// Runs one pass and checks that exactly keys are held afterwards, each one
	// counter higher with a new token that matches the store.
	HeldLeaseRegistry::LeaseMap RenewMutateAssert(LeaseRenewer& renewer,
												  std::initializer_list<std::string> keys = {})
	{
		const auto before = renewer.GetCurrentlyHeldLeases();
		renewer.RenewLeases();
		auto after = renewer.GetCurrentlyHeldLeases();

		EXPECT_EQ(after.size(), keys.size());
		for (const auto& key : keys)
		{
			const auto afterIt = after.find(key);
			const auto beforeIt = before.find(key);
			if (afterIt == after.end() || beforeIt == before.end())
			{
				ADD_FAILURE() << "lease " << key << " missing around renewal";
				continue;
			}
			EXPECT_EQ(afterIt->second.counter, beforeIt->second.counter + 1) << key;
			EXPECT_NE(afterIt->second.concurrencyToken, beforeIt->second.concurrencyToken) << key;

			const auto stored = store->GetLease(key);
			EXPECT_TRUE(stored.has_value()) << key;
			if (stored)
			{
				EXPECT_EQ(stored->counter, afterIt->second.counter) << key;
				EXPECT_EQ(stored->concurrencyToken, afterIt->second.concurrencyToken) << key;
			}
		}
		return after;
	}

   private:
	std::shared_ptr<InMemoryLeaseStore> store;
	std::vector<Lease> pending;
};
