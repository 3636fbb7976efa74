#ifndef UUIZ_V4_HPP
#define UUIZ_V4_HPP

namespace Uuiz { class RandomSource; }
namespace Uuiz { class Uuid; }

namespace Uuiz {
namespace V4 {

/** Uuiz::V4::generate
 *
 * @brief creates a random (version 4) UUID.
 *
 * @desc 122 bits come from the given source; the
 * version and variant bits are fixed.
 * Errors from the source propagate.
 * Stateless: any number of threads may call this as
 * long as the source is thread-safe.
 */
Uuid generate(RandomSource& rand);
/* Uses Uuiz::SecureRandom.  */
Uuid generate();

}}

#endif /* !defined(UUIZ_V4_HPP) */
