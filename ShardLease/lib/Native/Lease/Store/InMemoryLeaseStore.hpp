#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>

#include "Debug/Log.hpp"
#include "ILeaseStore.hpp"

// Process-local lease table. Backs single-process deployments and the test
// suite, so it carries a few fault injection switches.
class InMemoryLeaseStore : public ILeaseStore
{
   public:
	InMemoryLeaseStore() = default;

	LeaseWriteResult RenewLease(const Lease& lease) override;
	LeaseWriteResult UpdateLease(const Lease& lease, const std::optional<std::string>& checkpoint,
								 std::string_view expectedToken) override;
	std::vector<Lease> ListLeasesOwnedBy(std::string_view owner) override;

	bool CreateLeaseIfNotExists(const Lease& lease) override;
	std::optional<Lease> GetLease(std::string_view key) override;
	std::vector<Lease> ListLeases() override;
	LeaseWriteResult TakeLease(const Lease& lease, std::string_view newOwner) override;
	bool DeleteLease(std::string_view key) override;

	// Every call fails: writes report LeaseStoreFailure, reads throw.
	void SetUnavailable(bool value) { unavailable.store(value); }
	// The next n conditional writes report LeaseStoreFailure without applying.
	void FailNextWrites(int n) { failNextWrites.store(n); }
	// Sleep applied before every conditional write, outside the table lock.
	void SetWriteLatency(std::chrono::milliseconds latency) { writeLatencyMs.store(latency.count()); }

	[[nodiscard]] int64_t GetCallCount() const { return callCount.load(); }

   private:
	std::optional<LeaseStoreFailure> BeforeWrite();
	void BeforeRead();

	// Runs fn on the stored lease under the table lock if the token matches.
	template <class Fn>
	LeaseWriteResult ConditionalWrite(std::string_view key, std::string_view expectedToken, Fn&& fn);

	Log logger = Log("InMemoryLeaseStore");
	mutable std::mutex tableMutex;
	std::map<std::string, Lease, std::less<>> table;

	std::atomic_bool unavailable = false;
	std::atomic<int> failNextWrites = 0;
	std::atomic<int64_t> writeLatencyMs = 0;
	std::atomic<int64_t> callCount = 0;
};
