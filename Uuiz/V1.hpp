#ifndef UUIZ_V1_HPP
#define UUIZ_V1_HPP

#include<cstdint>

namespace Uuiz { class Clock; }
namespace Uuiz { class RandomSource; }
namespace Uuiz { class Uuid; }

namespace Uuiz {
namespace V1 {

/* 100ns ticks from 1582-10-15T00:00:00Z to the Unix epoch.  */
std::uint64_t const epoch_offset = 0x01B21DD213814000ULL;

/** class Uuiz::V1::Generator
 *
 * @brief creates time-based (version 1) UUIDs.
 *
 * @desc the node ID and clock sequence are drawn once,
 * at construction, from the random source.
 * Each call reads the clock; if the tick did not move
 * forward since the previous call, a rolling 14-bit
 * sequence is added to the clock sequence so that
 * outputs within one tick still differ.
 *
 * Not thread-safe: use one generator per thread, or
 * lock around it.
 * Movable but not copyable.
 * The clock must outlive the generator.
 */
class Generator {
private:
	Clock& clock;
	std::uint64_t last_timestamp;
	std::uint16_t sequence;
	std::uint64_t node_id;
	std::uint16_t clock_seq;

	std::uint64_t next_tick();

public:
	/* System clock and secure randomness.  */
	Generator();
	Generator(Clock& clock, RandomSource& rand);

	Generator(Generator&&) =default;
	/* Copies would repeat each other's outputs.  */
	Generator(Generator const&) =delete;
	Generator& operator=(Generator const&) =delete;

	/* Throws Uuiz::ClockError if the clock fails, in
	 * which case the generator state is unchanged.
	 */
	Uuid generate();

	/* 48-bit node ID placed in every output.  */
	std::uint64_t node() const { return node_id; }
	/* 14-bit clock sequence drawn at construction.  */
	std::uint16_t initial_clock_seq() const { return clock_seq; }
};

}}

#endif /* !defined(UUIZ_V1_HPP) */
