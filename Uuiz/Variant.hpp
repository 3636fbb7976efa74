#ifndef UUIZ_VARIANT_HPP
#define UUIZ_VARIANT_HPP

#include<iostream>
#include<string>

namespace Uuiz { class Uuid; }

namespace Uuiz {

/** enum class Uuiz::Variant
 *
 * @brief the layout family named by bits 62 and 63.
 *
 * @desc RFC 4122 reserves the pattern 111 for future
 * use, but with only two bits examined that cannot be
 * told apart from Microsoft's 110, so both are `ms`.
 */
enum class Variant {
	/* 0x: NCS backward compatibility.  */
	ncs,
	/* 10: RFC 4122.  */
	rfc4122,
	/* 11: Microsoft GUID (and reserved).  */
	ms
};

Variant variant(Uuid const&);

std::string to_string(Variant);
inline
std::ostream& operator<<(std::ostream& os, Variant v) {
	return os << to_string(v);
}

}

#endif /* !defined(UUIZ_VARIANT_HPP) */
