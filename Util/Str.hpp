#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include<cstddef>
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>

namespace Util {
namespace Str {

/* Outputs a two-digit lowercase hex string of the given byte.  */
std::string hexbyte(std::uint8_t);
/* Outputs the given data as lowercase hex, two digits per byte.  */
std::string hexdump(void const* p, std::size_t s);

/* Thrown by hexdigit.  */
struct HexParseFailure : public std::runtime_error {
	HexParseFailure(std::string msg)
		: std::runtime_error("hexdigit: " + msg) { }
};
/* Value of a single hex digit, either case.  */
std::uint8_t hexdigit(char c);
/* Checks a single character.  */
bool ishexdigit(char c);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
