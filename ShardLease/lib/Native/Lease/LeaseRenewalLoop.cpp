#include "LeaseRenewalLoop.hpp"

#include <stdexcept>

LeaseRenewalLoop::LeaseRenewalLoop(std::shared_ptr<LeaseRenewer> inRenewer)
	: LeaseRenewalLoop(std::move(inRenewer), Options{})
{
}

LeaseRenewalLoop::LeaseRenewalLoop(std::shared_ptr<LeaseRenewer> inRenewer, Options inOptions)
	: renewer(std::move(inRenewer)), options(std::move(inOptions))
{
	if (!renewer)
	{
		throw std::invalid_argument("LeaseRenewalLoop needs a renewer");
	}
	interval = options.interval.value_or(renewer->GetSettings().RenewalInterval());
	if (interval <= std::chrono::milliseconds::zero())
	{
		throw std::invalid_argument("LeaseRenewalLoop interval must be positive");
	}
}

LeaseRenewalLoop::~LeaseRenewalLoop()
{
	Stop();
}

void LeaseRenewalLoop::Start()
{
	if (LoopThread.joinable())
	{
		return;
	}
	logger.DebugFormatted("Renewing every {} ms", interval.count());
	LoopThread = std::jthread([this](std::stop_token st) { LoopEntry(st); });
}

void LeaseRenewalLoop::Stop()
{
	if (!LoopThread.joinable())
	{
		return;
	}
	LoopThread.request_stop();
	LoopThread.join();
	if (options.clearOnStop)
	{
		renewer->ClearCurrentlyHeldLeases();
	}
	logger.DebugFormatted("Stopped after {} passes", passCount.load());
}

void LeaseRenewalLoop::LoopEntry(std::stop_token st)
{
	while (!st.stop_requested())
	{
		const auto passStart = std::chrono::steady_clock::now();
		try
		{
			renewer->RenewLeases(st);
		}
		catch (const std::exception& e)
		{
			logger.ErrorFormatted("Renewal pass threw: {}", e.what());
		}
		++passCount;

		std::unique_lock lock(sleepMutex);
		sleepCv.wait_until(lock, st, passStart + interval, [] { return false; });
	}
}
