#include"Uuiz/Uuid.hpp"
#include"Uuiz/Variant.hpp"

namespace Uuiz {

Variant variant(Uuid const& u) {
	switch (u.byte(8) >> 6) {
	case 0x0:
	case 0x1:
		return Variant::ncs;
	case 0x2:
		return Variant::rfc4122;
	default:
		return Variant::ms;
	}
}

std::string to_string(Variant v) {
	switch (v) {
	case Variant::ncs: return "ncs";
	case Variant::rfc4122: return "rfc4122";
	case Variant::ms: return "ms";
	}
	return "unknown";
}

}
