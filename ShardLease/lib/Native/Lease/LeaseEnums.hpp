#pragma once
#include <boost/describe/enum.hpp>

// Why a lease left the held set.
enum class LeaseLossReason
{
	eExpired,
	eTokenMismatch,
	eNotFound,
	eStoreError,
	eDropped,
	eCleared
};
BOOST_DESCRIBE_ENUM(LeaseLossReason, eExpired, eTokenMismatch, eNotFound, eStoreError, eDropped,
					eCleared)

// What to do with a held lease when every renewal attempt in a pass hit a
// transient store failure.
enum class TransientFailurePolicy
{
	eRetainUntilExpiry,
	eEvictImmediately
};
BOOST_DESCRIBE_ENUM(TransientFailurePolicy, eRetainUntilExpiry, eEvictImmediately)
