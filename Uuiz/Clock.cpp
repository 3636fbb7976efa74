#include"Uuiz/Clock.hpp"
#include<chrono>

namespace Uuiz {

std::uint64_t SystemClock::nanoseconds() {
	auto since = std::chrono::system_clock::now().time_since_epoch();
	auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since);
	if (ns.count() < 0)
		throw ClockError("system clock is before 1970.");
	return std::uint64_t(ns.count());
}

SystemClock& SystemClock::instance() {
	static SystemClock rv;
	return rv;
}

}
