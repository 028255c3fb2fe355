#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "Debug/Log.hpp"
#include "Global/Misc/Singleton.hpp"
#include "RedisConnection.hpp"

// Process-wide cache of Redis connections keyed by endpoint. Stores that point
// at the same server share one connection pool.
class Redis : public Singleton<Redis>
{
   public:
	struct Options
	{
		std::string host = "127.0.0.1";
		int32_t port = 6379;
		bool IsCluster = false;
		uint32_t poolSize = 5;

		bool operator<(const Options& o) const
		{
			if (host != o.host)
				return host < o.host;
			if (port != o.port)
				return port < o.port;
			return IsCluster < o.IsCluster;
		}
	};

	// Throws sw::redis::Error once max_retries reconnect attempts are exhausted.
	std::shared_ptr<RedisConnection> Connect(const Options& options, uint32_t max_retries = 0,
											 uint32_t retry_interval_ms = 0);

   private:
	Log logger = Log("Redis");
	std::map<Options, std::weak_ptr<RedisConnection>> redis_connections;
	std::mutex connections_mutex;
};
