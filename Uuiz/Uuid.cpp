#include"Util/Str.hpp"
#include"Uuiz/Uuid.hpp"
#include<basicsecure.h>

namespace {

std::uint8_t const zero[16] = {0};

/* Byte offsets after which a hyphen appears in the
 * canonical form.
 */
bool hyphen_after(std::size_t byte) {
	return byte == 4 || byte == 6 || byte == 8 || byte == 10;
}

std::uint64_t read_be64(std::uint8_t const* p) {
	auto rv = std::uint64_t(0);
	for (auto i = 0; i < 8; ++i)
		rv = (rv << 8) | std::uint64_t(p[i]);
	return rv;
}

}

namespace Uuiz {

Uuid::Uuid(std::uint8_t const data[16]) {
	auto impl = std::make_shared<Impl>();
	for (auto i = std::size_t(0); i < 16; ++i)
		impl->data[i] = data[i];
	pimpl = std::move(impl);
}
Uuid::Uuid(std::uint64_t hi, std::uint64_t lo) {
	auto impl = std::make_shared<Impl>();
	for (auto i = std::size_t(0); i < 8; ++i) {
		impl->data[i] = std::uint8_t(hi >> (56 - 8 * i));
		impl->data[8 + i] = std::uint8_t(lo >> (56 - 8 * i));
	}
	pimpl = std::move(impl);
}

Uuid Uuid::max() {
	return Uuid(~std::uint64_t(0), ~std::uint64_t(0));
}

void Uuid::to_buffer(std::uint8_t data[16]) const {
	auto src = pimpl ? pimpl->data : zero;
	for (auto i = std::size_t(0); i < 16; ++i)
		data[i] = src[i];
}
std::uint64_t Uuid::high() const {
	return pimpl ? read_be64(&pimpl->data[0]) : 0;
}
std::uint64_t Uuid::low() const {
	return pimpl ? read_be64(&pimpl->data[8]) : 0;
}

bool Uuid::operator==(Uuid const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return basicsecure_eq(a, b, 16);
}
bool Uuid::operator<(Uuid const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	for (auto i = std::size_t(0); i < 16; ++i) {
		if (a[i] != b[i])
			return a[i] < b[i];
	}
	return false;
}

Uuid::operator bool() const {
	if (!pimpl)
		return false;
	return !basicsecure_eq(pimpl->data, zero, 16);
}

Uuid::operator std::string() const {
	auto data = pimpl ? pimpl->data : zero;
	auto rv = std::string();
	rv.reserve(36);
	for (auto i = std::size_t(0); i < 16; ++i) {
		if (hyphen_after(i))
			rv.push_back('-');
		rv += Util::Str::hexbyte(data[i]);
	}
	return rv;
}

Uuid::Uuid(std::string const& s) {
	if (s.size() != 36)
		throw FormatError(
			"expected 36 characters, got "
			+ std::to_string(s.size())
		);

	auto impl = std::make_shared<Impl>();
	auto pos = std::size_t(0);
	for (auto i = std::size_t(0); i < 16; ++i) {
		if (hyphen_after(i)) {
			if (s[pos] != '-')
				throw FormatError(
					"expected '-' at position "
					+ std::to_string(pos) + ": " + s
				);
			++pos;
		}
		auto c0 = s[pos];
		auto c1 = s[pos + 1];
		if (!Util::Str::ishexdigit(c0) || !Util::Str::ishexdigit(c1))
			throw FormatError(
				"non-hex digit near position "
				+ std::to_string(pos) + ": " + s
			);
		impl->data[i] = (Util::Str::hexdigit(c0) << 4)
			      | Util::Str::hexdigit(c1)
			      ;
		pos += 2;
	}
	pimpl = std::move(impl);
}
bool Uuid::valid_string(std::string const& s) {
	if (s.size() != 36)
		return false;
	for (auto i = std::size_t(0); i < s.size(); ++i) {
		if (i == 8 || i == 13 || i == 18 || i == 23) {
			if (s[i] != '-')
				return false;
		} else if (!Util::Str::ishexdigit(s[i]))
			return false;
	}
	return true;
}

std::size_t Uuid::hash() const {
	if (!pimpl)
		return 0;
	return std::size_t(high() ^ low());
}

}
