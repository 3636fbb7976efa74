#include"Uuiz/V5.hpp"

namespace Uuiz {

namespace Name {
template class Generator<Sha1::Hasher, Version::v5>;
}

namespace V5 {

Uuid generate(Uuid const& ns, std::string const& name) {
	return Generator(ns).generate(name);
}

}}
