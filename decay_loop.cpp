#include "decay_loop.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace lantern {

DecayLoop::DecayLoop(std::shared_ptr<SignalController> controller, int intervalMs)
	: controller_(std::move(controller)), intervalMs_(intervalMs < 0 ? 0 : intervalMs) {
	if (!controller_) throw std::invalid_argument("DecayLoop requires a signal controller");
}

DecayLoop::~DecayLoop() {
	stop();
}

void DecayLoop::start() {
	if (running_) return;
	if (intervalMs_ == 0) {
		std::cout << "[DecayLoop] Disabled (interval 0)" << std::endl;
		return;
	}
	running_ = true;
	worker_ = std::thread([this]() {
		std::unique_lock<std::mutex> lock(mu_);
		while (running_) {
			cv_.wait_for(lock, std::chrono::milliseconds(intervalMs_), [this]() { return !running_; });
			if (!running_) break;
			lock.unlock();
			runTick();
			lock.lock();
		}
	});
	std::cout << "[DecayLoop] Started, interval " << intervalMs_ << " ms" << std::endl;
}

void DecayLoop::stop() {
	{
		std::lock_guard<std::mutex> lock(mu_);
		if (!running_ && !worker_.joinable()) return;
		running_ = false;
	}
	cv_.notify_all();
	if (worker_.joinable()) worker_.join();
	std::cout << "[DecayLoop] Stopped after " << ticks_.load() << " ticks" << std::endl;
}

void DecayLoop::runTick() {
	ticks_++;
	try {
		DecayReport report = controller_->decayTick();
		if (report.skipped) return;
		if (report.stationsMoved > 0 || report.storageFailures > 0 || report.syncFailures > 0) {
			std::cout << "[DecayLoop] Tick " << ticks_.load() << ": visited=" << report.stationsVisited
					  << " moved=" << report.stationsMoved << " storageFailures=" << report.storageFailures
					  << " syncFailures=" << report.syncFailures << std::endl;
		}
	} catch (const std::exception &e) {
		std::cerr << "[DecayLoop] Tick " << ticks_.load() << " failed: " << e.what() << std::endl;
	}
}

} // namespace lantern
