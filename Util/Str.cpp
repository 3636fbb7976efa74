#include<iomanip>
#include<memory>
#include<sstream>
#include<stdio.h>
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	std::ostringstream os;
	os << std::hex << std::setfill('0') << std::setw(2);
	/* uint8_t might be a char, which iostreams would print
	 * as an ASCII character, so widen it first.
	 */
	os << ((unsigned int) v);
	return os.str();
}

std::string hexdump(void const* vp, std::size_t s) {
	auto rv = std::string();
	rv.reserve(s * 2);
	auto p = (std::uint8_t const*) vp;
	for (auto i = std::size_t(0); i < s; ++p, ++i)
		rv += hexbyte(*p);
	return rv;
}

bool ishexdigit(char c) {
	return ('0' <= c && c <= '9')
	    || ('a' <= c && c <= 'f')
	    || ('A' <= c && c <= 'F')
	     ;
}

std::uint8_t hexdigit(char c) {
	if (('0' <= c) && (c <= '9'))
		return (std::uint8_t) (c & 0xF);
	if ((('a' <= c) && (c <= 'f')) || (('A' <= c) && (c <= 'F')))
		return (std::uint8_t) ((c + 9) & 0xF);

	char s[2];
	s[0] = c;
	s[1] = 0;
	throw HexParseFailure("Non-hex character: " + std::string(s));
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	auto written = std::size_t(0);
	auto size = std::size_t(64);
	auto buf = std::unique_ptr<char[]>();
	do {
		if (size <= written)
			size = written + 1;
		buf = Util::make_unique<char[]>(size);
		va_copy(ap, ap_orig);
		written = std::size_t(vsnprintf(buf.get(), size, tpl, ap));
		va_end(ap);
	} while (size <= written);

	return std::string(buf.get());
}
std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
