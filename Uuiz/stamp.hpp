#ifndef UUIZ_STAMP_HPP
#define UUIZ_STAMP_HPP

#include"Uuiz/Uuid.hpp"
#include"Uuiz/Version.hpp"
#include<cstdint>

namespace Uuiz {

/** Uuiz::stamp
 *
 * @brief builds a UUID from 16 bytes in network order,
 * overwriting the version nibble with `v` and the
 * variant bits with RFC 4122's `10`.
 * The other 122 bits are kept.
 */
Uuid stamp(std::uint8_t const data[16], Version v);

}

#endif /* !defined(UUIZ_STAMP_HPP) */
