#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

#include "Debug/Log.hpp"
#include "Lease/LeaseRenewer.hpp"

// Runs renewal passes on a background thread, one every renewal interval.
class LeaseRenewalLoop
{
   public:
	struct Options
	{
		// Defaults to the renewer's RenewalInterval().
		std::optional<std::chrono::milliseconds> interval;
		// Release the held set when the loop stops.
		bool clearOnStop = true;
	};

	LeaseRenewalLoop(std::shared_ptr<LeaseRenewer> inRenewer, Options inOptions);
	explicit LeaseRenewalLoop(std::shared_ptr<LeaseRenewer> inRenewer);
	~LeaseRenewalLoop();

	void Start();
	// Cancels the pass in flight and joins the loop thread.
	void Stop();

	[[nodiscard]] bool IsRunning() const { return LoopThread.joinable(); }
	[[nodiscard]] uint64_t PassCount() const { return passCount.load(); }
	[[nodiscard]] std::chrono::milliseconds GetInterval() const { return interval; }

   private:
	void LoopEntry(std::stop_token st);

	Log logger = Log("LeaseRenewalLoop");
	std::shared_ptr<LeaseRenewer> renewer;
	Options options;
	std::chrono::milliseconds interval;
	std::atomic<uint64_t> passCount = 0;

	std::mutex sleepMutex;
	std::condition_variable_any sleepCv;
	std::jthread LoopThread;
};
