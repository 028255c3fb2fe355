#include "Redis.hpp"

#include <sw/redis++/connection.h>
#include <sw/redis++/connection_pool.h>
#include <sw/redis++/redis.h>
#include <sw/redis++/redis_cluster.h>

#include <chrono>
#include <thread>

std::shared_ptr<RedisConnection> Redis::Connect(const Options& in_options, uint32_t max_retries,
												uint32_t retry_interval_ms)
{
	{
		std::lock_guard<std::mutex> lock(connections_mutex);
		auto it = redis_connections.find(in_options);
		if (it != redis_connections.end())
		{
			if (auto cached = it->second.lock())
				return cached;
		}
	}

	sw::redis::ConnectionOptions options;
	options.host = in_options.host;
	options.port = in_options.port;

	sw::redis::ConnectionPoolOptions pool;
	pool.size = in_options.poolSize;

	uint32_t attempt = 0;

	for (;;)
	{
		try
		{
			std::shared_ptr<RedisConnection> redisC;

			if (in_options.IsCluster)
			{
				auto handle = std::make_unique<sw::redis::RedisCluster>(options, pool);
				handle->for_each([](sw::redis::Redis& r) { r.ping(); });
				redisC = std::make_shared<RedisConnection>(std::move(handle));
			}
			else
			{
				auto handle = std::make_unique<sw::redis::Redis>(options, pool);
				handle->ping();
				redisC = std::make_shared<RedisConnection>(std::move(handle));
			}

			std::lock_guard<std::mutex> lock(connections_mutex);
			auto& slot = redis_connections[in_options];

			// Another thread may have won the race
			if (auto existing = slot.lock())
				return existing;

			slot = redisC;
			logger.DebugFormatted("Connected to Redis at {}:{}{}", in_options.host,
								  in_options.port, in_options.IsCluster ? " (cluster)" : "");
			return redisC;
		}
		catch (const sw::redis::Error& e)
		{
			if (attempt >= max_retries)
			{
				logger.ErrorFormatted("Giving up on Redis at {}:{}: {}", in_options.host,
									  in_options.port, e.what());
				throw;
			}

			++attempt;
			logger.WarningFormatted("Redis connect failed (attempt {}/{}): {}", attempt,
									max_retries + 1, e.what());

			if (retry_interval_ms > 0)
			{
				std::this_thread::sleep_for(std::chrono::milliseconds(retry_interval_ms));
			}
		}
	}
}
