#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Debug/Log.hpp"
#include "Lease/Lease.hpp"

// The leases this worker believes it owns. Every read and write goes through
// one mutex, and nothing handed out aliases the stored entries.
class HeldLeaseRegistry
{
   public:
	using LeaseMap = std::unordered_map<std::string, Lease>;
	using Mutation = std::function<void(Lease&)>;

	explicit HeldLeaseRegistry(std::shared_ptr<Log> inLogger);

	// Inserts or replaces leases that carry a local renewal stamp, restamping
	// them with now. Returns how many were accepted.
	size_t Add(const std::vector<Lease>& leases, SteadyTimePoint now);

	[[nodiscard]] std::optional<Lease> Get(const std::string& key,
										   std::chrono::milliseconds leaseDuration,
										   SteadyTimePoint now) const;
	[[nodiscard]] LeaseMap GetAll(std::chrono::milliseconds leaseDuration,
								  SteadyTimePoint now) const;
	// Expired entries are included by Find and Snapshot.
	[[nodiscard]] std::optional<Lease> Find(const std::string& key) const;
	[[nodiscard]] std::vector<Lease> Snapshot() const;

	[[nodiscard]] size_t Size() const;

	void Clear();
	bool Remove(const std::string& key);
	// Drops the entry only if it still carries token.
	bool RemoveIfToken(const std::string& key, const std::string& token);
	// Compare-and-set: mutates the entry only if it still carries token.
	bool ApplyIfToken(const std::string& key, const std::string& token, const Mutation& mutation);

	// Serializes this worker's store writes for one lease key. A gate outlives
	// eviction while a writer still holds it, so a late writer and a re-added
	// lease share the same one.
	[[nodiscard]] std::shared_ptr<std::mutex> WriteGate(const std::string& key);
	// Drops gates of keys no longer held that no writer holds either.
	size_t PruneWriteGates();
	[[nodiscard]] size_t WriteGateCount() const;

   private:
	// Caller holds registryMutex.
	void PruneWriteGateLocked(const std::string& key);

	std::shared_ptr<Log> logger;
	mutable std::mutex registryMutex;
	LeaseMap heldLeases;
	std::unordered_map<std::string, std::shared_ptr<std::mutex>> writeGates;
};
