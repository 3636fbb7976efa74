#include"Uuiz/Fields.hpp"
#include"Uuiz/Uuid.hpp"

namespace {

std::uint64_t read_be(std::uint8_t const* p, int n) {
	auto rv = std::uint64_t(0);
	for (auto i = 0; i < n; ++i)
		rv = (rv << 8) | std::uint64_t(p[i]);
	return rv;
}
void write_be(std::uint8_t* p, int n, std::uint64_t v) {
	for (auto i = n - 1; i >= 0; --i) {
		p[i] = std::uint8_t(v & 0xFF);
		v >>= 8;
	}
}

}

namespace Uuiz {

Fields to_fields(Uuid const& u) {
	std::uint8_t b[16];
	u.to_buffer(b);

	auto rv = Fields();
	rv.time_low = std::uint32_t(read_be(&b[0], 4));
	rv.time_mid = std::uint16_t(read_be(&b[4], 2));
	rv.time_hi_and_version = std::uint16_t(read_be(&b[6], 2));
	rv.clock_seq_hi_and_res = b[8];
	rv.clock_seq_low = b[9];
	rv.node = read_be(&b[10], 6);
	return rv;
}

Uuid from_fields(Fields const& f) {
	std::uint8_t b[16];
	write_be(&b[0], 4, f.time_low);
	write_be(&b[4], 2, f.time_mid);
	write_be(&b[6], 2, f.time_hi_and_version);
	b[8] = f.clock_seq_hi_and_res;
	b[9] = f.clock_seq_low;
	write_be(&b[10], 6, f.node);
	return Uuid(b);
}

std::uint64_t timestamp(Fields const& f) {
	return (std::uint64_t(f.time_hi_and_version & 0x0FFF) << 48)
	     | (std::uint64_t(f.time_mid) << 32)
	     | std::uint64_t(f.time_low)
	     ;
}
std::uint16_t clock_seq(Fields const& f) {
	return std::uint16_t(((f.clock_seq_hi_and_res & 0x3F) << 8)
			    | f.clock_seq_low
			    );
}

bool operator==(Fields const& a, Fields const& b) {
	return a.time_low == b.time_low
	    && a.time_mid == b.time_mid
	    && a.time_hi_and_version == b.time_hi_and_version
	    && a.clock_seq_hi_and_res == b.clock_seq_hi_and_res
	    && a.clock_seq_low == b.clock_seq_low
	    && a.node == b.node
	     ;
}

}
