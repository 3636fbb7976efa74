#include"Uuiz/Clock.hpp"
#include"Uuiz/Fields.hpp"
#include"Uuiz/SecureRandom.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/V1.hpp"
#include"Uuiz/log.hpp"
#include<basicsecure.h>
#include<inttypes.h>

namespace {

std::uint16_t const seq_mask = 0x3FFF;
std::uint64_t const node_mask = 0xFFFFFFFFFFFFULL;

}

namespace Uuiz {
namespace V1 {

Generator::Generator()
	: Generator(SystemClock::instance(), SecureRandom::instance()) { }

Generator::Generator(Clock& clock_, RandomSource& rand)
	: clock(clock_)
	, last_timestamp(0)
	, sequence(0)
	, node_id(0)
	, clock_seq(0) {
	/* Bytes 0-5 are the node, 6-7 the clock sequence.  */
	std::uint8_t buf[8];
	rand.fill(buf, sizeof(buf));
	for (auto i = 0; i < 6; ++i)
		node_id = (node_id << 8) | buf[i];
	clock_seq = std::uint16_t(((buf[6] << 8) | buf[7]) & seq_mask);
	basicsecure_clear(buf, sizeof(buf));

	log( Debug
	   , "V1::Generator: node %012" PRIx64 ", clock sequence %04x"
	   , node_id, unsigned(clock_seq)
	   );
}

std::uint64_t Generator::next_tick() {
	auto tick = clock.nanoseconds() / 100 + epoch_offset;

	if (tick <= last_timestamp) {
		sequence = std::uint16_t((sequence + 1) & seq_mask);
		log( Trace
		   , "V1::Generator: tick %" PRIu64 " not after %" PRIu64
		     ", sequence %u"
		   , tick, last_timestamp, unsigned(sequence)
		   );
		if (sequence == 0)
			log( Warn
			   , "V1::Generator: sequence wrapped at tick %" PRIu64
			     ", outputs may repeat."
			   , tick
			   );
	} else
		sequence = 0;

	last_timestamp = tick;
	return tick;
}

Uuid Generator::generate() {
	auto tick = next_tick();
	auto seq = std::uint16_t((clock_seq + sequence) & seq_mask);

	auto f = Fields();
	f.time_low = std::uint32_t(tick);
	f.time_mid = std::uint16_t(tick >> 32);
	f.time_hi_and_version = std::uint16_t(((tick >> 48) & 0x0FFF) | 0x1000);
	f.clock_seq_hi_and_res = std::uint8_t(0x80 | (seq >> 8));
	f.clock_seq_low = std::uint8_t(seq & 0xFF);
	f.node = node_id & node_mask;

	return from_fields(f);
}

}}
