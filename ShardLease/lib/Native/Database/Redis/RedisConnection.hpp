#pragma once
#include <sw/redis++/redis++.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Thin synchronous facade over redis++ that hides whether the endpoint is a
// single node or a cluster. Every call may throw sw::redis::Error.
class RedisConnection
{
	bool IsCluster = false;

	std::unique_ptr<sw::redis::Redis> Handle;
	std::unique_ptr<sw::redis::RedisCluster> HandleCluster;

   public:
	template <class F>
	[[nodiscard]] decltype(auto) WithSync(F&& f) const
	{
		if (IsCluster)
			return std::forward<F>(f)(*HandleCluster);
		return std::forward<F>(f)(*Handle);
	}

	explicit RedisConnection(std::unique_ptr<sw::redis::Redis> redis)
		: IsCluster(false), Handle(std::move(redis))
	{
	}

	explicit RedisConnection(std::unique_ptr<sw::redis::RedisCluster> cluster)
		: IsCluster(true), HandleCluster(std::move(cluster))
	{
	}

	/**
	 * @brief Read a string key.
	 * @return std::nullopt if the key does not exist.
	 */
	[[nodiscard]] std::optional<std::string> Get(std::string_view key) const;

	/**
	 * @brief SET key value NX.
	 * @return true if the key was created, false if it already existed.
	 */
	[[nodiscard]] bool SetIfAbsent(std::string_view key, std::string_view value) const;

	/** @brief DEL a single key. Returns the number of keys removed (0 or 1). */
	[[nodiscard]] long long DelKey(std::string_view key) const;

	[[nodiscard]] long long SAdd(std::string_view key, std::string_view member) const;
	[[nodiscard]] long long SRem(std::string_view key, std::string_view member) const;
	[[nodiscard]] std::vector<std::string> SMembers(std::string_view key) const;

	/**
	 * @brief Run a Lua script that replies with a bulk string.
	 * @details In cluster mode all keys must hash to the same slot; callers pass
	 * exactly one key.
	 */
	[[nodiscard]] std::string EvalString(std::string_view script,
										 std::initializer_list<std::string_view> keys,
										 std::initializer_list<std::string_view> args) const;
};
