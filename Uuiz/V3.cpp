#include"Uuiz/V3.hpp"

namespace Uuiz {

namespace Name {
template class Generator<Md5::Hasher, Version::v3>;
}

namespace V3 {

Uuid generate(Uuid const& ns, std::string const& name) {
	return Generator(ns).generate(name);
}

}}
