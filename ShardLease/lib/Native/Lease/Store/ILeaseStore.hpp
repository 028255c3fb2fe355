#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Lease/Lease.hpp"

// Outcomes of a conditional write. The store applies the write only if the
// caller's token matches the one it currently holds for the lease.
struct LeaseWriteSuccess
{
	std::string newToken;
};
struct LeaseTokenMismatch
{
};
struct LeaseNotFound
{
};
struct LeaseStoreFailure
{
	std::string message;
};
using LeaseWriteResult =
	std::variant<LeaseWriteSuccess, LeaseTokenMismatch, LeaseNotFound, LeaseStoreFailure>;

[[nodiscard]] inline bool IsWriteSuccess(const LeaseWriteResult& result)
{
	return std::holds_alternative<LeaseWriteSuccess>(result);
}
[[nodiscard]] std::string_view DescribeWriteResult(const LeaseWriteResult& result);

// Raised by read operations when the store cannot be reached.
class LeaseStoreException : public std::runtime_error
{
   public:
	using std::runtime_error::runtime_error;
};

// Shared lease table with conditional-write semantics. Implementations must be
// safe to call from several threads at once.
class ILeaseStore
{
   public:
	virtual ~ILeaseStore() = default;

	// Conditional on lease.concurrencyToken. Success bumps the stored counter by
	// one and replaces the token.
	virtual LeaseWriteResult RenewLease(const Lease& lease) = 0;

	// Conditional on expectedToken. Also stores checkpoint and resets the owner
	// switch count.
	virtual LeaseWriteResult UpdateLease(const Lease& lease,
										 const std::optional<std::string>& checkpoint,
										 std::string_view expectedToken) = 0;

	virtual std::vector<Lease> ListLeasesOwnedBy(std::string_view owner) = 0;

	// Lease management used by acquisition code.
	virtual bool CreateLeaseIfNotExists(const Lease& lease) = 0;
	virtual std::optional<Lease> GetLease(std::string_view key) = 0;
	virtual std::vector<Lease> ListLeases() = 0;
	virtual LeaseWriteResult TakeLease(const Lease& lease, std::string_view newOwner) = 0;
	virtual bool DeleteLease(std::string_view key) = 0;
};
