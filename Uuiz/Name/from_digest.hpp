#ifndef UUIZ_NAME_FROM_DIGEST_HPP
#define UUIZ_NAME_FROM_DIGEST_HPP

#include"Uuiz/Uuid.hpp"
#include"Uuiz/Version.hpp"
#include"Uuiz/stamp.hpp"
#include<basicsecure.h>
#include<cstdint>

namespace Uuiz {
namespace Name {

/** Uuiz::Name::from_digest
 *
 * @brief turns the first 16 bytes of a hash digest into
 * a name-based UUID of the given version.
 *
 * @desc `Hash` is one of the Md5::Hash or Sha1::Hash
 * value types.
 */
template<typename Hash>
Uuid from_digest(Hash const& h, Version v) {
	static_assert(Hash::size >= 16, "digest too short for a UUID");
	std::uint8_t buf[Hash::size];
	h.to_buffer(buf);
	auto rv = stamp(buf, v);
	basicsecure_clear(buf, sizeof(buf));
	return rv;
}

/* Feeds the namespace in network byte order.  */
template<typename Hasher>
void feed_namespace(Hasher& hasher, Uuid const& ns) {
	std::uint8_t buf[16];
	ns.to_buffer(buf);
	hasher.feed(buf, sizeof(buf));
}

}}

#endif /* !defined(UUIZ_NAME_FROM_DIGEST_HPP) */
