#undef NDEBUG
#include"Uuiz/Namespace.hpp"
#include"Uuiz/Uuid.hpp"
#include"Uuiz/V3.hpp"
#include"Uuiz/V5.hpp"
#include"Uuiz/Variant.hpp"
#include"Uuiz/Version.hpp"
#include<assert.h>
#include<set>
#include<utility>

int main() {
	auto dns = Uuiz::Namespace::dns();

	{
		auto v3 = Uuiz::V3::Generator(dns);
		assert(v3.get_namespace() == dns);
		auto a = v3.generate("uuiz");
		auto b = v3.generate("uuiz");
		assert(a == b);
		assert(std::string(a) == "70352d73-3343-337c-9b95-054a59de3994");
		assert(Uuiz::version(a) == Uuiz::Version::v3);
		assert(Uuiz::variant(a) == Uuiz::Variant::rfc4122);

		/* From the Python documentation.  */
		assert( std::string(v3.generate("python.org"))
		     == "6fa459ea-ee8a-3ca4-894e-db77e160355e"
		      );
		/* Raw bytes work the same as strings.  */
		assert(v3.generate("python.org", 10) == v3.generate(std::string("python.org")));
		assert(Uuiz::V3::generate(dns, "uuiz") == a);
	}

	{
		auto v5 = Uuiz::V5::Generator(dns);
		auto a = v5.generate("uuiz");
		auto b = v5.generate("uuiz");
		assert(a == b);
		assert(std::string(a) == "d8859eab-8b5f-518b-98f5-5927a61ab2b0");
		assert(Uuiz::version(a) == Uuiz::Version::v5);
		assert(Uuiz::variant(a) == Uuiz::Variant::rfc4122);
		assert(a != Uuiz::V3::generate(dns, "uuiz"));

		assert( std::string(v5.generate("python.org"))
		     == "886313e1-3b8a-5372-9b90-0c9aee199e5d"
		      );
		assert(Uuiz::V5::generate(dns, "uuiz") == a);
	}

	/* Namespace matters.  */
	{
		auto url = Uuiz::Namespace::url();
		assert( std::string(Uuiz::V3::generate(url, "https://example.com/"))
		     == "b9dcdff8-af4a-365d-8043-0f8361942709"
		      );
		assert( std::string(Uuiz::V5::generate(url, "https://example.com/"))
		     == "dd2c1780-811a-5296-81c5-178a0ef488bc"
		      );
		assert(Uuiz::V5::generate(url, "uuiz") != Uuiz::V5::generate(dns, "uuiz"));
	}

	/* Distinct names give distinct outputs.  */
	{
		auto v5 = Uuiz::V5::Generator(dns);
		auto seen = std::set<Uuiz::Uuid>();
		for (auto i = 0; i < 500; ++i)
			seen.insert(v5.generate("host" + std::to_string(i) + ".example"));
		assert(seen.size() == 500);
	}

	/* One-shot contexts.  */
	{
		auto ctx = Uuiz::V3::Context(dns);
		assert(ctx);
		assert(ctx.get_namespace() == dns);
		auto a = std::move(ctx).generate("uuiz");
		assert(std::string(a) == "70352d73-3343-337c-9b95-054a59de3994");
		assert(!ctx);

		auto thrown = false;
		try {
			std::move(ctx).generate("uuiz");
		} catch (Uuiz::ReuseError const&) {
			thrown = true;
		}
		assert(thrown);
	}
	{
		auto ctx = Uuiz::V5::Context(dns);
		auto moved = std::move(ctx);
		assert(moved);
		assert(!ctx);
		auto thrown = false;
		try {
			std::move(ctx).generate("uuiz");
		} catch (std::logic_error const&) {
			thrown = true;
		}
		assert(thrown);
		assert( std::move(moved).generate("python.org")
		     == Uuiz::V5::generate(dns, "python.org")
		      );
	}

	return 0;
}
