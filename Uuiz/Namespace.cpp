#include"Uuiz/Namespace.hpp"

namespace {

/* The four differ only in the low byte of time_low.  */
std::uint64_t const rfc4122_hi = 0x6ba7b8009dad11d1ULL;
std::uint64_t const rfc4122_lo = 0x80b400c04fd430c8ULL;

}

namespace Uuiz {
namespace Namespace {

Uuid dns() {
	return Uuid(rfc4122_hi | (std::uint64_t(0x10) << 32), rfc4122_lo);
}
Uuid url() {
	return Uuid(rfc4122_hi | (std::uint64_t(0x11) << 32), rfc4122_lo);
}
Uuid oid() {
	return Uuid(rfc4122_hi | (std::uint64_t(0x12) << 32), rfc4122_lo);
}
Uuid x500() {
	return Uuid(rfc4122_hi | (std::uint64_t(0x14) << 32), rfc4122_lo);
}

Uuid lookup(std::string const& s) {
	if (s == "dns")
		return dns();
	if (s == "url")
		return url();
	if (s == "oid")
		return oid();
	if (s == "x500")
		return x500();
	return Uuid(s);
}

}}
