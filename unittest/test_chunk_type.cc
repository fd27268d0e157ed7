#include <doctest/doctest.h>
#include <pngc/chunk_type.hh>
#include <pngc/chunk_types.hh>
#include <pngc/exceptions.hh>

#include <sstream>
#include <unordered_set>
#include <set>
#include <array>

using namespace pngc;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk type construction") {
        SUBCASE("from raw bytes") {
            chunk_type::bytes_type expected{82, 117, 83, 116};
            chunk_type actual(expected);
            CHECK(actual.bytes() == expected);
            CHECK(actual.to_string() == "RuSt");
        }

        SUBCASE("from individual chars") {
            chunk_type t('R', 'u', 'S', 't');
            CHECK(t[0] == 'R');
            CHECK(t[1] == 'u');
            CHECK(t[2] == 'S');
            CHECK(t[3] == 't');
        }

        SUBCASE("from_bytes copies four bytes") {
            unsigned char raw[6] = {'t', 'E', 'X', 't', 'z', 'z'};
            CHECK(chunk_type::from_bytes(raw).to_string() == "tEXt");
        }

        SUBCASE("any bytes are stored") {
            chunk_type::bytes_type binary{0x00, 0x31, 0xFF, 0x7F};
            chunk_type t(binary);
            CHECK(t.bytes() == binary);
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("from_string") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t == chunk_type('R', 'u', 'S', 't'));
        }

        SUBCASE("from_string accepts a lowercase reserved bit") {
            chunk_type t = chunk_type::from_string("Rust");
            CHECK(t.to_string() == "Rust");
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("from_string rejects non-letters") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("Ru t"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string(std::string_view("Ru\0t", 4)), invalid_chunk_type);
        }

        SUBCASE("from_string rejects wrong sizes") {
            CHECK_THROWS_AS(chunk_type::from_string("RuS"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string("RuStt"), invalid_chunk_type);
            CHECK_THROWS_AS(chunk_type::from_string(""), invalid_chunk_type);
        }

        SUBCASE("literal") {
            constexpr auto ihdr = "IHDR"_ctype;
            CHECK(ihdr == chunk_types::IHDR);
            CHECK_THROWS_AS("IHD"_ctype, std::invalid_argument);
        }
    }

    TEST_CASE("chunk type properties") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("RuSt") {
            constexpr chunk_type t('R', 'u', 'S', 't');
            static_assert(t.is_valid());
            CHECK(t.is_valid());
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
        }

        SUBCASE("validity") {
            CHECK(chunk_type::from_string("RuSt").is_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_valid());
            CHECK_FALSE(chunk_type('R', 'u', '1', 't').is_valid());
            CHECK_FALSE(chunk_type('1', 'u', 'S', 't').is_valid());
            CHECK_FALSE(chunk_type('R', 'u', 'S', '@').is_valid());
            CHECK_FALSE(chunk_type('R', '[', 'S', 't').is_valid());
        }

        SUBCASE("standard critical chunks") {
            for (const auto& t : {chunk_types::IHDR, chunk_types::PLTE, chunk_types::IDAT, chunk_types::IEND}) {
                CHECK(t.is_valid());
                CHECK(t.is_critical());
                CHECK(t.is_public());
                CHECK_FALSE(t.is_safe_to_copy());
            }
        }

        SUBCASE("standard ancillary chunks") {
            CHECK_FALSE(chunk_types::tEXt.is_critical());
            CHECK(chunk_types::tEXt.is_safe_to_copy());
            CHECK_FALSE(chunk_types::sRGB.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk type comparison") {
        SUBCASE("equality") {
            CHECK(chunk_type::from_string("RuSt") == chunk_type('R', 'u', 'S', 't'));
            CHECK(chunk_type::from_string("RuSt") != chunk_type::from_string("RuST"));
        }

        SUBCASE("ordering is byte-wise") {
            CHECK(chunk_types::IDAT < chunk_types::IEND);
            CHECK(chunk_types::IHDR > chunk_types::IEND);
            // uppercase sorts before lowercase
            CHECK(chunk_type::from_string("RUSt") < chunk_type::from_string("RuSt"));
            CHECK(chunk_types::IEND <= chunk_types::IEND);
            CHECK(chunk_types::IEND >= chunk_types::IEND);
        }

        SUBCASE("set") {
            std::set<chunk_type> types{chunk_types::IEND, chunk_types::IHDR, chunk_types::IDAT};
            CHECK(*types.begin() == chunk_types::IDAT);
        }

        SUBCASE("hash") {
            std::unordered_set<chunk_type> types;
            types.insert(chunk_types::IHDR);
            types.insert("IHDR"_ctype);
            types.insert(chunk_types::IEND);
            CHECK(types.size() == 2);
            CHECK(types.count(chunk_type::from_string("IEND")) == 1);
        }
    }

    TEST_CASE("chunk type text") {
        SUBCASE("to_string and to_string_view") {
            chunk_type t = chunk_type::from_string("RuSt");
            CHECK(t.to_string() == "RuSt");
            CHECK(t.to_string_view() == "RuSt");
            CHECK(t.to_string_view().size() == 4);
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::from_string("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("to_bytes") {
            unsigned char out[4];
            chunk_types::IEND.to_bytes(out);
            CHECK(out[0] == 'I');
            CHECK(out[1] == 'E');
            CHECK(out[2] == 'N');
            CHECK(out[3] == 'D');
        }
    }

    TEST_CASE("standard chunk types") {
        CHECK(is_standard(chunk_types::IHDR));
        CHECK(is_standard(chunk_types::IEND));
        CHECK(is_standard(chunk_type::from_string("tEXt")));
        CHECK(is_standard(chunk_type::from_string("pHYs")));
        CHECK_FALSE(is_standard(chunk_type::from_string("RuSt")));
        CHECK_FALSE(is_standard(chunk_type::from_string("ruSt")));
        // case matters
        CHECK_FALSE(is_standard(chunk_type::from_string("TEXT")));
    }
}
