#include"Uuiz/Version.hpp"

namespace Uuiz {

std::uint8_t version_nibble(Uuid const& u) {
	return u.byte(6) >> 4;
}

Version version(Uuid const& u) {
	auto nibble = version_nibble(u);
	switch (nibble) {
	case 1: return Version::v1;
	case 2: return Version::v2;
	case 3: return Version::v3;
	case 4: return Version::v4;
	case 5: return Version::v5;
	case 6: return Version::v6;
	case 7: return Version::v7;
	case 8: return Version::v8;
	}
	throw VersionError(nibble);
}

Parsed parse(std::string const& s) {
	auto u = Uuid(s);
	auto v = version(u);
	return Parsed{std::move(u), v};
}

std::string to_string(Version v) {
	return "v" + std::to_string(int(v));
}

}
