#include"Uuiz/stamp.hpp"

namespace Uuiz {

Uuid stamp(std::uint8_t const data[16], Version v) {
	std::uint8_t b[16];
	for (auto i = 0; i < 16; ++i)
		b[i] = data[i];

	/* time_hi_and_version, high nibble.  */
	b[6] = std::uint8_t((b[6] & 0x0F) | (int(v) << 4));
	/* clock_seq_hi_and_reserved, top two bits.  */
	b[8] = std::uint8_t((b[8] & 0x3F) | 0x80);

	return Uuid(b);
}

}
