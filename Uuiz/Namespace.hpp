#ifndef UUIZ_NAMESPACE_HPP
#define UUIZ_NAMESPACE_HPP

#include"Uuiz/Uuid.hpp"
#include<string>

namespace Uuiz {

/** namespace Uuiz::Namespace
 *
 * @brief the namespace UUIDs of RFC 4122 appendix C,
 * for use with name-based generation.
 */
namespace Namespace {

/* 6ba7b810-9dad-11d1-80b4-00c04fd430c8, fully-qualified domain names.  */
Uuid dns();
/* 6ba7b811-9dad-11d1-80b4-00c04fd430c8, URLs.  */
Uuid url();
/* 6ba7b812-9dad-11d1-80b4-00c04fd430c8, ISO OIDs.  */
Uuid oid();
/* 6ba7b814-9dad-11d1-80b4-00c04fd430c8, X.500 DNs (DER or text).  */
Uuid x500();

/* Looks up "dns", "url", "oid" or "x500", or else parses
 * `s` as a UUID.  Throws Uuiz::FormatError.
 */
Uuid lookup(std::string const& s);

}}

#endif /* !defined(UUIZ_NAMESPACE_HPP) */
