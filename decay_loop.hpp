#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "signal_controller.hpp"

namespace lantern {

// Background worker that calls SignalController::decayTick() every
// intervalMs. An interval of 0 disables the loop.
class DecayLoop {
public:
	DecayLoop(std::shared_ptr<SignalController> controller, int intervalMs);
	~DecayLoop();

	void start();
	void stop();

	bool running() const { return running_; }
	int intervalMs() const { return intervalMs_; }
	long ticks() const { return ticks_; }

private:
	void runTick();

	std::shared_ptr<SignalController> controller_;
	int intervalMs_{60000};
	std::atomic<bool> running_{false};
	std::atomic<long> ticks_{0};
	std::mutex mu_;
	std::condition_variable cv_;
	std::thread worker_;
};

} // namespace lantern
