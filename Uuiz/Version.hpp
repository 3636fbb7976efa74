#ifndef UUIZ_VERSION_HPP
#define UUIZ_VERSION_HPP

#include"Uuiz/Uuid.hpp"
#include<cstdint>
#include<iostream>
#include<stdexcept>
#include<string>

namespace Uuiz {

/** enum class Uuiz::Version
 *
 * @brief the generation scheme named by bits 76 to 79
 * of a UUID.
 */
enum class Version {
	/* Time-based.  */
	v1 = 1,
	/* DCE security.  */
	v2 = 2,
	/* Name-based, MD5.  */
	v3 = 3,
	/* Random.  */
	v4 = 4,
	/* Name-based, SHA-1.  */
	v5 = 5,
	/* Reordered time.  */
	v6 = 6,
	/* Unix time plus random.  */
	v7 = 7,
	/* Custom.  */
	v8 = 8
};

/* The version nibble is not one of 1 to 8.  */
struct VersionError : public std::invalid_argument {
	std::uint8_t nibble;

	VersionError(std::uint8_t nibble_)
		: std::invalid_argument( "Uuiz::VersionError: undefined version "
				       + std::to_string(unsigned(nibble_))
				       )
		, nibble(nibble_) { }
};

/* The raw 4-bit version field.  */
std::uint8_t version_nibble(Uuid const&);
/* Throws Uuiz::VersionError if the nibble is 0 or 9 to 15.  */
Version version(Uuid const&);

/** struct Uuiz::Parsed
 *
 * @brief a UUID read from text along with its version.
 */
struct Parsed {
	Uuid uuid;
	Version version;
};
/* Throws Uuiz::FormatError or Uuiz::VersionError.  */
Parsed parse(std::string const&);

std::string to_string(Version);
inline
std::ostream& operator<<(std::ostream& os, Version v) {
	return os << to_string(v);
}

}

#endif /* !defined(UUIZ_VERSION_HPP) */
