// Lease renewal engine and checkpoint update path.

#include "LeaseRenewer.hpp"

#include <boost/asio/post.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <condition_variable>
#include <mutex>
#include <stdexcept>

#include "Global/Misc/Overloaded.hpp"

namespace
{
LeaseRenewerSettings Validated(LeaseRenewerSettings settings)
{
	settings.Validate();
	return settings;
}
}  // namespace

// Shared between a pass and its tasks; outlives the pass when calls run late.
struct LeaseRenewer::PassState
{
	std::mutex mutex;
	std::condition_variable_any done;
	size_t completed = 0;
	RenewalPassReport report;
	std::stop_source stop;

	void Record(RenewalOutcome outcome, const std::string& key)
	{
		std::scoped_lock lock(mutex);
		switch (outcome)
		{
			case RenewalOutcome::eRenewed:
				++report.renewed;
				break;
			case RenewalOutcome::eLost:
				++report.lost;
				report.lostLeaseKeys.push_back(key);
				break;
			case RenewalOutcome::eExpired:
				++report.expired;
				report.expiredLeaseKeys.push_back(key);
				break;
			case RenewalOutcome::eTransientFailure:
				++report.transientFailures;
				break;
			case RenewalOutcome::eTransientEvicted:
				++report.transientFailures;
				++report.lost;
				report.lostLeaseKeys.push_back(key);
				break;
			case RenewalOutcome::eSkipped:
				break;
		}
		++completed;
		done.notify_all();
	}
};

LeaseRenewer::LeaseRenewer(std::shared_ptr<ILeaseStore> inStore, LeaseRenewerSettings inSettings,
						   SteadyNowFn inClock)
	: store(std::move(inStore)),
	  settings(Validated(std::move(inSettings))),
	  clock(inClock ? std::move(inClock) : SteadyNowFn([] { return SteadyClock::now(); })),
	  logger(std::make_shared<Log>("LeaseRenewer:" + settings.workerIdentifier)),
	  registry(logger),
	  renewalPool(settings.maxRenewalThreads)
{
	if (!store)
	{
		throw std::invalid_argument("LeaseRenewer needs a lease store");
	}
}

LeaseRenewer::~LeaseRenewer()
{
	// Queued renewals are dropped; calls already talking to the store finish.
	renewalPool.stop();
	renewalPool.join();
}

void LeaseRenewer::Initialize()
{
	std::vector<Lease> owned;
	try
	{
		owned = store->ListLeasesOwnedBy(settings.workerIdentifier);
	}
	catch (const LeaseStoreException& e)
	{
		logger->ErrorFormatted("Initialize could not list leases owned by {}: {}",
							   settings.workerIdentifier, e.what());
		throw;
	}

	std::vector<Lease> toSeed;
	toSeed.reserve(owned.size());
	for (auto& lease : owned)
	{
		if (settings.renewOnInitialize)
		{
			const LeaseWriteResult result = CallStore([&] { return store->RenewLease(lease); });
			const auto* success = std::get_if<LeaseWriteSuccess>(&result);
			if (!success)
			{
				logger->WarningFormatted("Not resuming lease {}: renewal returned {}", lease.key,
										 DescribeWriteResult(result));
				continue;
			}
			lease.counter += 1;
			lease.concurrencyToken = success->newToken;
		}
		lease.lastRenewalLocalTime = Now();
		toSeed.push_back(std::move(lease));
	}

	const size_t seeded = registry.Add(toSeed, Now());
	logger->DebugFormatted("Initialized with {} of {} owned leases", seeded, owned.size());
}

size_t LeaseRenewer::AddLeasesToRenew(const std::vector<Lease>& leases)
{
	const size_t added = registry.Add(leases, Now());
	if (added != leases.size())
	{
		logger->WarningFormatted("Added {} of {} leases; the rest had no local renewal time", added,
								 leases.size());
	}
	return added;
}

std::optional<Lease> LeaseRenewer::GetCurrentlyHeldLease(const std::string& key) const
{
	return registry.Get(key, settings.leaseDuration, Now());
}

HeldLeaseRegistry::LeaseMap LeaseRenewer::GetCurrentlyHeldLeases() const
{
	return registry.GetAll(settings.leaseDuration, Now());
}

void LeaseRenewer::ClearCurrentlyHeldLeases()
{
	logger->DebugFormatted("Clearing {} held leases ({})", registry.Size(),
						   boost::describe::enum_to_string(LeaseLossReason::eCleared, "?"));
	registry.Clear();
}

bool LeaseRenewer::DropLease(const std::string& key)
{
	const bool dropped = registry.Remove(key);
	if (dropped)
	{
		logger->DebugFormatted("Dropped lease {} ({})", key,
							   boost::describe::enum_to_string(LeaseLossReason::eDropped, "?"));
	}
	return dropped;
}

LeaseWriteResult LeaseRenewer::CallStore(const std::function<LeaseWriteResult()>& call) const
{
	try
	{
		return call();
	}
	catch (const std::exception& e)
	{
		return LeaseStoreFailure{e.what()};
	}
}

bool LeaseRenewer::EvictIfToken(const Lease& lease, LeaseLossReason reason)
{
	if (!registry.RemoveIfToken(lease.key, lease.concurrencyToken))
	{
		return false;
	}
	logger->WarningFormatted("Lost lease {} at counter {}: {}", lease.key, lease.counter,
							 boost::describe::enum_to_string(reason, "unknown"));
	return true;
}

bool LeaseRenewer::UpdateLease(const Lease& lease, const std::string& expectedToken)
{
	const auto gate = registry.WriteGate(lease.key);
	std::scoped_lock gateLock(*gate);

	std::optional<Lease> held = registry.Find(lease.key);
	if (!held)
	{
		logger->DebugFormatted("Update of {} rejected: not held", lease.key);
		return false;
	}
	if (held->IsExpired(settings.leaseDuration, Now()))
	{
		EvictIfToken(*held, LeaseLossReason::eExpired);
		return false;
	}
	if (held->concurrencyToken != expectedToken)
	{
		// The caller's copy predates a loss and re-acquisition of this lease.
		logger->DebugFormatted("Update of {} rejected: stale concurrency token", lease.key);
		return false;
	}

	for (uint32_t attempt = 1; attempt <= settings.renewalAttempts; ++attempt)
	{
		const LeaseWriteResult result =
			CallStore([&] { return store->UpdateLease(*held, lease.checkpoint, expectedToken); });

		const std::optional<bool> done = std::visit(
			Overloaded{[&](const LeaseWriteSuccess& success) -> std::optional<bool>
					   {
						   return registry.ApplyIfToken(lease.key, expectedToken,
														[&](Lease& entry)
														{
															entry.counter += 1;
															entry.concurrencyToken = success.newToken;
															entry.lastRenewalLocalTime = Now();
															entry.checkpoint = lease.checkpoint;
															entry.ownerSwitchesSinceCheckpoint = 0;
														});
					   },
					   [&](const LeaseTokenMismatch&) -> std::optional<bool>
					   {
						   EvictIfToken(*held, LeaseLossReason::eTokenMismatch);
						   return false;
					   },
					   [&](const LeaseNotFound&) -> std::optional<bool>
					   {
						   EvictIfToken(*held, LeaseLossReason::eNotFound);
						   return false;
					   },
					   [&](const LeaseStoreFailure& failure) -> std::optional<bool>
					   {
						   logger->WarningFormatted("Update of {} failed (attempt {}/{}): {}",
													lease.key, attempt, settings.renewalAttempts,
													failure.message);
						   return std::nullopt;
					   }},
			result);
		if (done.has_value())
		{
			return *done;
		}
	}

	if (settings.transientFailurePolicy == TransientFailurePolicy::eEvictImmediately)
	{
		EvictIfToken(*held, LeaseLossReason::eStoreError);
	}
	return false;
}

LeaseRenewer::RenewalOutcome LeaseRenewer::RenewLease(const std::string& key,
													  const std::stop_token& st)
{
	const auto gate = registry.WriteGate(key);
	std::scoped_lock gateLock(*gate);

	std::optional<Lease> held;
	for (uint32_t attempt = 1; attempt <= settings.renewalAttempts; ++attempt)
	{
		if (st.stop_requested())
		{
			return RenewalOutcome::eSkipped;
		}

		// Re-read under the gate: a checkpoint update may have moved the token
		// since the pass took its snapshot.
		held = registry.Find(key);
		if (!held)
		{
			return RenewalOutcome::eSkipped;
		}
		if (held->IsExpired(settings.leaseDuration, Now()))
		{
			return EvictIfToken(*held, LeaseLossReason::eExpired) ? RenewalOutcome::eExpired
																  : RenewalOutcome::eSkipped;
		}

		const LeaseWriteResult result = CallStore([&] { return store->RenewLease(*held); });

		if (const auto* success = std::get_if<LeaseWriteSuccess>(&result))
		{
			const bool applied = registry.ApplyIfToken(key, held->concurrencyToken,
													   [&](Lease& entry)
													   {
														   entry.counter += 1;
														   entry.concurrencyToken = success->newToken;
														   entry.lastRenewalLocalTime = Now();
													   });
			if (!applied)
			{
				logger->DebugFormatted("Renewal of {} landed after the lease left the held set", key);
				return RenewalOutcome::eSkipped;
			}
			return RenewalOutcome::eRenewed;
		}
		if (std::holds_alternative<LeaseTokenMismatch>(result))
		{
			return EvictIfToken(*held, LeaseLossReason::eTokenMismatch) ? RenewalOutcome::eLost
																		: RenewalOutcome::eSkipped;
		}
		if (std::holds_alternative<LeaseNotFound>(result))
		{
			return EvictIfToken(*held, LeaseLossReason::eNotFound) ? RenewalOutcome::eLost
																   : RenewalOutcome::eSkipped;
		}

		logger->WarningFormatted("Renewal of {} failed (attempt {}/{}): {}", key, attempt,
								 settings.renewalAttempts,
								 std::get<LeaseStoreFailure>(result).message);
	}

	if (settings.transientFailurePolicy == TransientFailurePolicy::eEvictImmediately && held &&
		EvictIfToken(*held, LeaseLossReason::eStoreError))
	{
		return RenewalOutcome::eTransientEvicted;
	}
	return RenewalOutcome::eTransientFailure;
}

RenewalPassReport LeaseRenewer::RenewLeases()
{
	return RenewLeases(std::stop_token{});
}

RenewalPassReport LeaseRenewer::RenewLeases(std::stop_token st)
{
	// Gates left behind by evictions that happened under a writer.
	registry.PruneWriteGates();

	auto state = std::make_shared<PassState>();
	const auto now = Now();

	size_t submitted = 0;
	for (const Lease& lease : registry.Snapshot())
	{
		// Expired leases go without asking the store.
		if (lease.IsExpired(settings.leaseDuration, now))
		{
			if (EvictIfToken(lease, LeaseLossReason::eExpired))
			{
				std::scoped_lock lock(state->mutex);
				++state->report.expired;
				state->report.expiredLeaseKeys.push_back(lease.key);
			}
			continue;
		}

		++submitted;
		boost::asio::post(renewalPool,
						  [this, state, key = lease.key]
						  {
							  const RenewalOutcome outcome = RenewLease(key, state->stop.get_token());
							  state->Record(outcome, key);
						  });
	}

	const auto deadline = SteadyClock::now() + settings.renewalPassTimeout;
	std::unique_lock lock(state->mutex);
	const bool finished =
		state->done.wait_until(lock, st, deadline, [&] { return state->completed == submitted; });
	if (!finished)
	{
		// Unstarted renewals are abandoned; calls already in flight still land
		// through the token check.
		state->stop.request_stop();
	}

	RenewalPassReport report = state->report;
	report.pending = submitted - state->completed;
	lock.unlock();

	if (report.pending > 0)
	{
		logger->WarningFormatted("Renewal pass ended with {} of {} renewals outstanding{}",
								 report.pending, submitted,
								 st.stop_requested() ? " (cancelled)" : "");
	}
	logger->DebugFormatted("Renewal pass: {} renewed, {} lost, {} expired, {} transient failures",
						   report.renewed, report.lost, report.expired, report.transientFailures);
	return report;
}
