#pragma once
#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "Debug/Log.hpp"
#include "Lease/HeldLeaseRegistry.hpp"
#include "Lease/LeaseEnums.hpp"
#include "Lease/LeaseRenewerSettings.hpp"
#include "Lease/Store/ILeaseStore.hpp"

struct RenewalPassReport
{
	size_t renewed = 0;
	// Evicted after the store reported the lease gone or owned under another token.
	size_t lost = 0;
	// Evicted locally because the lease duration elapsed.
	size_t expired = 0;
	size_t transientFailures = 0;
	// Not finished when the pass deadline hit or the pass was cancelled.
	size_t pending = 0;
	std::vector<std::string> lostLeaseKeys;
	std::vector<std::string> expiredLeaseKeys;
};

// Keeps this worker's leases alive.
/*
 * Held leases live in a HeldLeaseRegistry. RenewLeases fans one conditional
 * renew per lease out to a bounded thread pool and waits up to
 * renewalPassTimeout. Store calls still running at the deadline are allowed to
 * finish; their result is applied only if the registry entry still carries the
 * token the call was issued with, so a late reply never resurrects or rolls
 * back a lease. Renewals and checkpoint updates of the same lease never overlap
 * (see HeldLeaseRegistry::WriteGate).
 */
class LeaseRenewer
{
   public:
	LeaseRenewer(std::shared_ptr<ILeaseStore> inStore, LeaseRenewerSettings inSettings,
				 SteadyNowFn inClock = {});
	~LeaseRenewer();

	LeaseRenewer(const LeaseRenewer&) = delete;
	LeaseRenewer& operator=(const LeaseRenewer&) = delete;

	// Seeds the held set with every lease the store attributes to this worker.
	// Rethrows LeaseStoreException after logging it.
	void Initialize();

	// Leases without a local renewal time are ignored. Returns how many were added.
	size_t AddLeasesToRenew(const std::vector<Lease>& leases);

	[[nodiscard]] std::optional<Lease> GetCurrentlyHeldLease(const std::string& key) const;
	[[nodiscard]] HeldLeaseRegistry::LeaseMap GetCurrentlyHeldLeases() const;

	void ClearCurrentlyHeldLeases();
	// Gives up one lease locally without touching the store.
	bool DropLease(const std::string& key);

	// Persists lease.checkpoint against the held lease with this key. Fails
	// without a store call if the lease is not held or its token is not
	// expectedToken. A rejected write evicts the lease.
	bool UpdateLease(const Lease& lease, const std::string& expectedToken);

	RenewalPassReport RenewLeases();
	RenewalPassReport RenewLeases(std::stop_token st);

	[[nodiscard]] const LeaseRenewerSettings& GetSettings() const { return settings; }

   private:
	enum class RenewalOutcome
	{
		eRenewed,
		eLost,
		eExpired,
		eTransientFailure,
		eTransientEvicted,
		eSkipped
	};
	struct PassState;

	RenewalOutcome RenewLease(const std::string& key, const std::stop_token& st);
	LeaseWriteResult CallStore(const std::function<LeaseWriteResult()>& call) const;
	bool EvictIfToken(const Lease& lease, LeaseLossReason reason);

	[[nodiscard]] SteadyTimePoint Now() const { return clock(); }

	std::shared_ptr<ILeaseStore> store;
	LeaseRenewerSettings settings;
	SteadyNowFn clock;
	std::shared_ptr<Log> logger;
	HeldLeaseRegistry registry;

	// Declared last: joined before the members its tasks touch are destroyed.
	boost::asio::thread_pool renewalPool;
};
