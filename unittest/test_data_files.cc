//
// Records stored in unittest/data
//

#include <doctest/doctest.h>
#include <pngc/chunk.hh>
#include <pngc/chunk_types.hh>
#include <pngc/exceptions.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngc;

TEST_CASE("Data files") {
    SUBCASE("secret message record") {
        auto data = load_test_data("secret_message.chunk");
        REQUIRE(data.size() == 54);

        chunk c = chunk::parse(data);
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.crc() == secret_message_crc);
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.as_bytes() == data);
    }

    SUBCASE("corrupted record") {
        auto data = load_test_data("corrupted_crc.chunk");
        CHECK_THROWS_AS(chunk::parse(data), invalid_crc);
    }

    SUBCASE("records read one after another from a file stream") {
        auto is = load_test("text_then_end.bin");
        REQUIRE(is->good());

        std::vector<chunk> chunks;
        chunks.push_back(chunk::read(*is));
        chunks.push_back(chunk::read(*is));

        CHECK(chunks[0].type() == chunk_types::tEXt);
        CHECK(chunks[0].data() == to_bytes(std::string("Comment\0hi", 10)));
        CHECK(chunks[0].crc() == 0xA2A25866u);
        CHECK(chunks[1] == chunk(chunk_types::IEND, {}));
    }
}
