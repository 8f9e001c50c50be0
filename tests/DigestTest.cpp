#include "TestDoubles.hpp"
#include "utils/Digest.hpp"
#include "utils/FS.hpp"

#include <string>

#include <doctest/doctest.h>

TEST_CASE("sha256 of known inputs")
{
    CHECK(folio::utils::sha256_bytes(std::string_view{}) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(folio::utils::sha256_bytes(std::string_view("abc")) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_file matches the in-memory digest")
{
    folio::test::ScratchDir scratch("digest");
    auto file = scratch / "doc.md";
    std::string text(200000, 'x');
    text += "\n# tail\n";
    REQUIRE(folio::utils::write_file_atomic(file, text));

    auto digest = folio::utils::sha256_file(file);
    REQUIRE(digest);
    CHECK(*digest == folio::utils::sha256_bytes(std::string_view(text)));
    CHECK(digest->size() == 64);

    CHECK_FALSE(folio::utils::sha256_file(scratch / "absent.md"));
}

TEST_CASE("to_hex renders lowercase pairs")
{
    std::uint8_t const bytes[] = {0x00, 0x0f, 0xab, 0xff};
    CHECK(folio::utils::to_hex(bytes) == "000fabff");
}
