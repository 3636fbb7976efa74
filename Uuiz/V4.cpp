#include"Uuiz/SecureRandom.hpp"
#include"Uuiz/V4.hpp"
#include"Uuiz/stamp.hpp"
#include<basicsecure.h>

namespace Uuiz {
namespace V4 {

Uuid generate(RandomSource& rand) {
	std::uint8_t buf[16];
	rand.fill(buf, sizeof(buf));
	auto rv = stamp(buf, Version::v4);
	basicsecure_clear(buf, sizeof(buf));
	return rv;
}

Uuid generate() {
	return generate(SecureRandom::instance());
}

}}
