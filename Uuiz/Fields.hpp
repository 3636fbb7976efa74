#ifndef UUIZ_FIELDS_HPP
#define UUIZ_FIELDS_HPP

#include<cstdint>

namespace Uuiz { class Uuid; }

namespace Uuiz {

/** struct Uuiz::Fields
 *
 * @brief the RFC 4122 section 4.1.2 field layout of a
 * UUID, each field read in network byte order.
 *
 * @desc this is only a view; the Uuid remains the
 * source of truth.
 * `node` holds 48 bits in its low bits.
 */
struct Fields {
	std::uint32_t time_low;
	std::uint16_t time_mid;
	std::uint16_t time_hi_and_version;
	std::uint8_t clock_seq_hi_and_res;
	std::uint8_t clock_seq_low;
	std::uint64_t node;
};

Fields to_fields(Uuid const&);
/* Inverse of to_fields.  Bits of `node` above bit 47 are
 * ignored.
 */
Uuid from_fields(Fields const&);

/* The 60-bit time of a version 1 UUID, in 100ns ticks since
 * 1582-10-15.
 */
std::uint64_t timestamp(Fields const&);
/* The 14-bit clock sequence.  */
std::uint16_t clock_seq(Fields const&);

bool operator==(Fields const&, Fields const&);
inline
bool operator!=(Fields const& a, Fields const& b) {
	return !(a == b);
}

}

#endif /* !defined(UUIZ_FIELDS_HPP) */
