#ifndef UUIZ_CLOCK_HPP
#define UUIZ_CLOCK_HPP

#include<cstdint>
#include<stdexcept>
#include<string>

namespace Uuiz {

struct ClockError : public std::runtime_error {
	ClockError(std::string const& msg)
		: std::runtime_error("Uuiz::ClockError: " + msg) { }
};

/** class Uuiz::Clock
 *
 * @brief abstract wall clock used by time-based
 * generation.
 */
class Clock {
public:
	virtual ~Clock() { }
	/* Nanoseconds since 1970-01-01T00:00:00Z.
	 * Throws Uuiz::ClockError if the time cannot be read.
	 */
	virtual std::uint64_t nanoseconds() =0;
};

/** class Uuiz::SystemClock
 *
 * @brief std::chrono::system_clock.
 */
class SystemClock : public Clock {
public:
	std::uint64_t nanoseconds() override;

	static SystemClock& instance();
};

}

#endif /* !defined(UUIZ_CLOCK_HPP) */
