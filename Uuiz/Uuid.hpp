#ifndef UUIZ_UUID_HPP
#define UUIZ_UUID_HPP

#include<cstddef>
#include<cstdint>
#include<iostream>
#include<memory>
#include<stdexcept>
#include<string>
#include<utility>

namespace Uuiz {

/* Thrown when a string is not a canonical-form UUID.  */
struct FormatError : public std::invalid_argument {
	FormatError(std::string const& msg)
		: std::invalid_argument("Uuiz::FormatError: " + msg) { }
};

/** class Uuiz::Uuid
 *
 * @brief an RFC 4122 universally unique identifier,
 * a 128-bit value.
 *
 * @desc the value is held as 16 bytes in network
 * byte order, i.e. byte 0 holds the most significant
 * bits of `time_low`.
 * All bit positions in this library count from the
 * least significant bit of that big-endian 128-bit
 * integer, so the version nibble is bits 76 to 79
 * (high nibble of byte 6) and the variant is bits
 * 62 and 63 (top of byte 8).
 *
 * A default-constructed Uuid is the nil UUID.
 * Objects are immutable; copies share storage.
 */
class Uuid {
private:
	struct Impl {
		std::uint8_t data[16];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	Uuid() =default;
	Uuid(Uuid&&) =default;
	Uuid(Uuid const&) =default;
	Uuid& operator=(Uuid&&) =default;
	Uuid& operator=(Uuid const&) =default;
	~Uuid() =default;

	/* From 16 bytes in network byte order.  */
	explicit Uuid(std::uint8_t const data[16]);
	/* From the high and low halves of the 128-bit value.  */
	Uuid(std::uint64_t hi, std::uint64_t lo);

	/* 00000000-0000-0000-0000-000000000000 */
	static Uuid nil() { return Uuid(); }
	/* ffffffff-ffff-ffff-ffff-ffffffffffff */
	static Uuid max();

	/* Writes the 16 bytes in network byte order.  */
	void to_buffer(std::uint8_t data[16]) const;
	std::uint8_t byte(std::size_t i) const {
		return pimpl ? pimpl->data[i] : 0;
	}
	std::uint64_t high() const;
	std::uint64_t low() const;

	bool operator==(Uuid const& o) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}
	/* Ordering of the 128-bit values.  */
	bool operator<(Uuid const& o) const;

	/* True unless this is the nil UUID.  */
	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	/* Canonical 8-4-4-4-12 lowercase form.  */
	explicit operator std::string() const;
	/* Parses the canonical form, either case.
	 * Throws Uuiz::FormatError.
	 */
	explicit Uuid(std::string const&);
	static
	bool valid_string(std::string const&);

	std::size_t hash() const;
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}
inline
std::istream& operator>>(std::istream& is, Uuid& i) {
	auto s = std::string();
	if (is >> s)
		i = Uuid(s);
	return is;
}

}

namespace std {

template<>
struct hash<Uuiz::Uuid> {
	std::size_t operator()(Uuiz::Uuid const& i) const {
		return i.hash();
	}
};

}

#endif /* !defined(UUIZ_UUID_HPP) */
