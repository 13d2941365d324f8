#include "mappers/mapper.hpp"
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <utility>

using namespace famicore;
using namespace famicore::test;

namespace {

// PRG image where every 16KB bank is filled with its own index
CartridgeImage banked_image(int mapper_id, size_t prg_banks, size_t chr_banks) {
    CartridgeImage image;
    image.mapper_id = mapper_id;
    image.prg_rom.resize(prg_banks * 0x4000);
    for (size_t i = 0; i < image.prg_rom.size(); i++) {
        image.prg_rom[i] = static_cast<uint8_t>(i / 0x4000);
    }
    image.chr_rom.resize(chr_banks * 0x2000);
    for (size_t i = 0; i < image.chr_rom.size(); i++) {
        image.chr_rom[i] = static_cast<uint8_t>(0x80 | (i / 0x2000));
    }
    return image;
}

} // namespace

TEST_CASE("NROM-128 mirrors its 16KB bank", "[mapper]") {
    auto mapper = make_mapper(banked_image(0, 1, 1));
    CHECK(mapper->get_id() == 0);
    CHECK(mapper->read_prg(0x8000) == 0);
    CHECK(mapper->read_prg(0xC000) == 0);

    // ROM writes are ignored
    mapper->write_prg(0x8000, 0x55);
    CHECK(mapper->read_prg(0x8000) == 0);
}

TEST_CASE("NROM-256 maps 32KB", "[mapper]") {
    auto mapper = make_mapper(banked_image(0, 2, 1));
    CHECK(mapper->read_prg(0x8000) == 0);
    CHECK(mapper->read_prg(0xBFFF) == 0);
    CHECK(mapper->read_prg(0xC000) == 1);
    CHECK(mapper->read_prg(0xFFFF) == 1);
}

TEST_CASE("PRG RAM", "[mapper]") {
    auto mapper = make_mapper(banked_image(0, 1, 1));
    mapper->write_prg(0x6000, 0x12);
    mapper->write_prg(0x7FFF, 0x34);
    CHECK(mapper->read_prg(0x6000) == 0x12);
    CHECK(mapper->read_prg(0x7FFF) == 0x34);
}

TEST_CASE("CHR ROM is read-only, CHR RAM is writable", "[mapper]") {
    auto rom = make_mapper(banked_image(0, 1, 1));
    CHECK(!rom->has_chr_ram());
    rom->write_chr(0x0000, 0x11);
    CHECK(rom->read_chr(0x0000) == 0x80);

    auto ram = make_mapper(banked_image(0, 1, 0));
    CHECK(ram->has_chr_ram());
    ram->write_chr(0x1FFF, 0x22);
    CHECK(ram->read_chr(0x1FFF) == 0x22);
}

TEST_CASE("UxROM switches the low bank", "[mapper]") {
    auto mapper = make_mapper(banked_image(2, 8, 0));
    CHECK(mapper->read_prg(0x8000) == 0);
    CHECK(mapper->read_prg(0xC000) == 7);

    mapper->write_prg(0x8000, 3);
    CHECK(mapper->read_prg(0x8000) == 3);
    CHECK(mapper->read_prg(0xBFFF) == 3);
    CHECK(mapper->read_prg(0xFFFF) == 7);

    // Bank numbers wrap around the ROM size
    mapper->write_prg(0xFFFF, 9);
    CHECK(mapper->read_prg(0x8000) == 1);

    mapper->reset();
    CHECK(mapper->read_prg(0x8000) == 0);
}

TEST_CASE("CNROM switches CHR banks", "[mapper]") {
    auto mapper = make_mapper(banked_image(3, 2, 4));
    CHECK(mapper->read_chr(0x0000) == 0x80);

    mapper->write_prg(0x8000, 2);
    CHECK(mapper->read_chr(0x0000) == 0x82);
    CHECK(mapper->read_chr(0x1FFF) == 0x82);
    CHECK(mapper->read_prg(0xC000) == 1);
}

TEST_CASE("AxROM switches 32KB banks and the single screen", "[mapper]") {
    auto mapper = make_mapper(banked_image(7, 8, 0));

    // Powers up in the last bank
    CHECK(mapper->read_prg(0x8000) == 6);
    CHECK(mapper->read_prg(0xC000) == 7);
    CHECK(mapper->get_mirror_mode() == MirrorMode::SingleScreen0);

    mapper->write_prg(0x8000, 0x11);
    CHECK(mapper->read_prg(0x8000) == 2);
    CHECK(mapper->read_prg(0xC000) == 3);
    CHECK(mapper->get_mirror_mode() == MirrorMode::SingleScreen1);

    mapper->write_prg(0x8000, 0x00);
    CHECK(mapper->get_mirror_mode() == MirrorMode::SingleScreen0);
}

TEST_CASE("AxROM ignores writes to CHR ROM", "[mapper]") {
    CartridgeImage image = banked_image(7, 2, 0);
    image.chr_rom.assign(0x2000, 0x5A);
    auto mapper = make_mapper(std::move(image));
    REQUIRE(!mapper->has_chr_ram());

    mapper->write_chr(0x0000, 0x11);
    mapper->write_chr(0x1FFF, 0x22);
    CHECK(mapper->read_chr(0x0000) == 0x5A);
    CHECK(mapper->read_chr(0x1FFF) == 0x5A);
}

TEST_CASE("AxROM CHR RAM is writable", "[mapper]") {
    auto mapper = make_mapper(banked_image(7, 2, 0));
    REQUIRE(mapper->has_chr_ram());

    mapper->write_chr(0x0123, 0x11);
    CHECK(mapper->read_chr(0x0123) == 0x11);
}

TEST_CASE("create_mapper rejects what it cannot run", "[mapper]") {
    CartridgeError error = CartridgeError::None;

    CHECK(create_mapper(banked_image(4, 2, 1), error) == nullptr);
    CHECK(error == CartridgeError::UnsupportedMapper);

    // NROM tops out at 32KB PRG / 8KB CHR
    CHECK(create_mapper(banked_image(0, 4, 1), error) == nullptr);
    CHECK(error == CartridgeError::InvalidRomSize);
    CHECK(create_mapper(banked_image(0, 2, 2), error) == nullptr);
    CHECK(error == CartridgeError::InvalidRomSize);

    // AxROM needs whole 32KB banks
    CHECK(create_mapper(banked_image(7, 3, 0), error) == nullptr);
    CHECK(error == CartridgeError::InvalidRomSize);

    CHECK(create_mapper(banked_image(2, 16, 0), error) != nullptr);
    CHECK(error == CartridgeError::None);
}
