#include"Md5/Hash.hpp"
#include"Util/Str.hpp"
#include<basicsecure.h>

namespace {

std::uint8_t const zero[16] = {0};

}

namespace Md5 {

constexpr std::size_t Hash::size;

Hash::operator std::string() const {
	if (!pimpl)
		return "00000000000000000000000000000000";
	return Util::Str::hexdump(pimpl->d, 16);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return basicsecure_eq(a, b, 16);
}

}
