#include "gff/gff.hpp"
#include "gff/gff_easy.hpp"
#include "test_util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

// Reference document covering every field kind: a root with 18 fields, a
// child struct holding one field and a list of two empty structs.
static const std::uint8_t kReferenceGff[] = {
    0x47, 0x46, 0x46, 0x20, 0x56, 0x33, 0x2E, 0x32, 0x38, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
    0x68, 0x00, 0x00, 0x00, 0x13, 0x00, 0x00, 0x00, 0x4C, 0x01, 0x00, 0x00, 0x13, 0x00, 0x00, 0x00,
    0x7C, 0x02, 0x00, 0x00, 0x90, 0x00, 0x00, 0x00, 0x0C, 0x03, 0x00, 0x00, 0x48, 0x00, 0x00, 0x00,
    0x54, 0x03, 0x00, 0x00, 0x0C, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00,
    0x12, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00,
    0xFF, 0xFF, 0xFF, 0xFF, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xFF, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x81, 0xFF, 0xFF, 0xFF,
    0x02, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00,
    0x03, 0x00, 0x00, 0x00, 0x00, 0x80, 0xFF, 0xFF, 0x04, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
    0xFF, 0xFF, 0xFF, 0xFF, 0x05, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x80,
    0x06, 0x00, 0x00, 0x00, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00,
    0x07, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00,
    0xDD, 0x87, 0x45, 0x41, 0x09, 0x00, 0x00, 0x00, 0x09, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00,
    0x0A, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x00, 0x00, 0x18, 0x00, 0x00, 0x00, 0x0B, 0x00, 0x00, 0x00,
    0x0B, 0x00, 0x00, 0x00, 0x2F, 0x00, 0x00, 0x00, 0x0C, 0x00, 0x00, 0x00, 0x0C, 0x00, 0x00, 0x00,
    0x38, 0x00, 0x00, 0x00, 0x0D, 0x00, 0x00, 0x00, 0x0D, 0x00, 0x00, 0x00, 0x66, 0x00, 0x00, 0x00,
    0x10, 0x00, 0x00, 0x00, 0x0E, 0x00, 0x00, 0x00, 0x74, 0x00, 0x00, 0x00, 0x11, 0x00, 0x00, 0x00,
    0x0F, 0x00, 0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x0E, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x11, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
    0x0F, 0x00, 0x00, 0x00, 0x12, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x75, 0x69, 0x6E, 0x74,
    0x38, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x69, 0x6E, 0x74, 0x38,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x75, 0x69, 0x6E, 0x74,
    0x31, 0x36, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x69, 0x6E, 0x74, 0x31,
    0x36, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x75, 0x69, 0x6E, 0x74,
    0x33, 0x32, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x69, 0x6E, 0x74, 0x33,
    0x32, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x75, 0x69, 0x6E, 0x74,
    0x36, 0x34, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x69, 0x6E, 0x74, 0x36,
    0x34, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x73, 0x69, 0x6E, 0x67,
    0x6C, 0x65, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x64, 0x6F, 0x75, 0x62,
    0x6C, 0x65, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x73, 0x74, 0x72, 0x69,
    0x6E, 0x67, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x72, 0x65, 0x73, 0x72,
    0x65, 0x66, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x6C, 0x6F, 0x63, 0x73,
    0x74, 0x72, 0x69, 0x6E, 0x67, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x62, 0x69, 0x6E, 0x61,
    0x72, 0x79, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x6F, 0x72, 0x69, 0x65,
    0x6E, 0x74, 0x61, 0x74, 0x69, 0x6F, 0x6E, 0x00, 0x00, 0x00, 0x00, 0x00, 0x70, 0x6F, 0x73, 0x69,
    0x74, 0x69, 0x6F, 0x6E, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x63, 0x68, 0x69, 0x6C,
    0x64, 0x5F, 0x73, 0x74, 0x72, 0x75, 0x63, 0x74, 0x00, 0x00, 0x00, 0x00, 0x63, 0x68, 0x69, 0x6C,
    0x64, 0x5F, 0x75, 0x69, 0x6E, 0x74, 0x38, 0x00, 0x00, 0x00, 0x00, 0x00, 0x6C, 0x69, 0x73, 0x74,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0x7F, 0x00, 0x00, 0x00, 0x00, 0x3B, 0x6F, 0x2F, 0xD3,
    0xFC, 0xB0, 0x28, 0x40, 0x13, 0x00, 0x00, 0x00, 0x61, 0x62, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68,
    0x69, 0x6A, 0x31, 0x32, 0x33, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x08, 0x72, 0x65, 0x73, 0x72,
    0x65, 0x66, 0x30, 0x31, 0x2A, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0x02, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00, 0x6D, 0x61, 0x6C, 0x65, 0x5F, 0x65, 0x6E, 0x67,
    0x05, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x00, 0x00, 0x66, 0x65, 0x6D, 0x5F, 0x67, 0x65, 0x72, 0x6D,
    0x61, 0x6E, 0x0A, 0x00, 0x00, 0x00, 0x62, 0x69, 0x6E, 0x61, 0x72, 0x79, 0x64, 0x61, 0x74, 0x61,
    0x00, 0x00, 0x80, 0x3F, 0x00, 0x00, 0x00, 0x40, 0x00, 0x00, 0x40, 0x40, 0x00, 0x00, 0x80, 0x40,
    0x00, 0x00, 0x30, 0x41, 0x00, 0x00, 0xB0, 0x41, 0x00, 0x00, 0x04, 0x42, 0x00, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
    0x05, 0x00, 0x00, 0x00, 0x06, 0x00, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00, 0x08, 0x00, 0x00, 0x00,
    0x09, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x00, 0x00, 0x0B, 0x00, 0x00, 0x00, 0x0C, 0x00, 0x00, 0x00,
    0x0D, 0x00, 0x00, 0x00, 0x0E, 0x00, 0x00, 0x00, 0x0F, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00,
    0x12, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00
};

static std::vector<std::uint8_t> reference_bytes() {
    return std::vector<std::uint8_t>(std::begin(kReferenceGff), std::end(kReferenceGff));
}

static gff::GffDocument build_reference() {
    gff::GffDocument doc;
    gff::GffStruct& root = doc.root();

    root.set_uint8("uint8", 255);
    root.set_int8("int8", -127);
    root.set_uint16("uint16", 65535);
    root.set_int16("int16", -32768);
    root.set_uint32("uint32", 4294967295u);
    root.set_int32("int32", -2147483647 - 1);
    root.set_uint64("uint64", 4294967296ull);
    root.set_int64("int64", 2147483647);
    root.set_single("single", 12.34567f);
    root.set_double("double", 12.345678901234);
    root.set_string("string", "abcdefghij123456789");
    root.set_resref("resref", gff::ResRef("resref01"));

    gff::LocalizedString loc;
    loc.set(gff::Language::English, gff::Gender::Male, "male_eng");
    loc.set(gff::Language::German, gff::Gender::Female, "fem_german");
    root.set_locstring("locstring", loc);

    const std::string bin = "binarydata";
    root.set_binary("binary", gff::Binary(bin.begin(), bin.end()));
    root.set_vector4("orientation", gff::Vector4{1.0f, 2.0f, 3.0f, 4.0f});
    root.set_vector3("position", gff::Vector3{11.0f, 22.0f, 33.0f});

    gff::GffStruct& child = root.set_struct("child_struct", gff::GffStruct(0));
    child.set_uint8("child_uint8", 4);

    gff::GffList& list = root.set_list("list", {});
    list.emplace_back(1);
    list.emplace_back(2);
    return doc;
}

static void test_header() {
    const std::vector<std::uint8_t> bytes = reference_bytes();
    CHECK(bytes.size() == 864);

    gff::Header h = gff::read_header(bytes);
    CHECK(h.content_tag == "GFF ");
    CHECK(h.version == "V3.2");
    CHECK(h.structs.offset == 56 && h.structs.count == 4);
    CHECK(h.fields.offset == 104 && h.fields.count == 19);
    CHECK(h.labels.offset == 332 && h.labels.count == 19);
    CHECK(h.field_data.offset == 636 && h.field_data.count == 144);
    CHECK(h.field_indices.offset == 780 && h.field_indices.count == 72);
    CHECK(h.list_indices.offset == 852 && h.list_indices.count == 12);

    // The header encoder is the exact inverse.
    std::vector<std::uint8_t> again = gff::encode_header(h);
    CHECK(again.size() == gff::kHeaderSize);
    CHECK(std::equal(again.begin(), again.end(), bytes.begin()));
}

static void test_decoded_values() {
    gff::GffDocument doc = gff::decode(reference_bytes());
    const gff::GffStruct& root = doc.root();

    CHECK(doc.content_tag() == "GFF ");
    CHECK(doc.content() == gff::GffContent::GFF);
    CHECK(root.type_id() == -1);
    CHECK(root.size() == 18);

    CHECK(root.get_uint8("uint8") == 255);
    CHECK(root.get_int8("int8") == -127);
    CHECK(root.get_uint16("uint16") == 65535);
    CHECK(root.get_int16("int16") == -32768);
    CHECK(root.get_uint32("uint32") == 4294967295u);
    CHECK(root.get_int32("int32") == -2147483647 - 1);
    CHECK(root.get_uint64("uint64") == 4294967296ull);
    CHECK(root.get_int64("int64") == 2147483647);
    CHECK(std::fabs(root.get_single("single") - 12.34567f) < 1e-5f);
    CHECK(std::fabs(root.get_double("double") - 12.345678901234) < 1e-12);
    CHECK(root.get_string("string") == "abcdefghij123456789");
    CHECK(root.get_resref("resref").str() == "resref01");

    const gff::LocalizedString& loc = root.get_locstring("locstring");
    CHECK(loc.stringref() == -1);
    CHECK(!loc.has_stringref());
    CHECK(loc.size() == 2);
    CHECK(loc.get(gff::Language::English, gff::Gender::Male) == std::string("male_eng"));
    CHECK(loc.get(gff::Language::German, gff::Gender::Female) == std::string("fem_german"));
    CHECK(loc.get_by_id(5) == std::string("fem_german"));
    CHECK(!loc.get(gff::Language::French, gff::Gender::Male).has_value());

    const gff::Binary& bin = root.get_binary("binary");
    CHECK(std::string(bin.begin(), bin.end()) == "binarydata");

    CHECK((root.get_vector4("orientation") == gff::Vector4{1.0f, 2.0f, 3.0f, 4.0f}));
    CHECK((root.get_vector3("position") == gff::Vector3{11.0f, 22.0f, 33.0f}));

    const gff::GffStruct& child = root.get_struct("child_struct");
    CHECK(child.type_id() == 0);
    CHECK(child.size() == 1);
    CHECK(child.get_uint8("child_uint8") == 4);

    const gff::GffList& list = root.get_list("list");
    CHECK(list.size() == 2);
    CHECK(list[0].type_id() == 1 && list[0].empty());
    CHECK(list[1].type_id() == 2 && list[1].empty());

    // Field order on disk is kept.
    CHECK(root.fields().front().label() == "uint8");
    CHECK(root.fields()[14].label() == "orientation");
    CHECK(root.fields().back().label() == "list");

    CHECK(gff::easy::find_field(root, "child_struct\\child_uint8").type() == gff::GffFieldType::UInt8);
    CHECK(gff::easy::find_struct(root, "list/1").type_id() == 2);
}

static void test_reencode_is_byte_identical() {
    const std::vector<std::uint8_t> bytes = reference_bytes();
    gff::GffDocument doc = gff::decode(bytes);

    CHECK(gff::encode(doc) == bytes);

    gff::WriteOptions plain;
    plain.dedupe_field_data = false;
    CHECK(gff::encode(doc, plain) == bytes);
}

static void test_built_document_matches() {
    gff::GffDocument built = build_reference();
    const std::vector<std::uint8_t> bytes = reference_bytes();

    CHECK(gff::encode(built) == bytes);

    std::vector<std::string> diffs;
    bool same = built.compare(gff::decode(bytes), [&](const std::string& line) { diffs.push_back(line); });
    CHECK(same);
    CHECK(diffs.empty());
    CHECK(built == gff::decode(bytes));
}

static void test_file_roundtrip() {
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "gff_cpp_reference.gff";
    std::filesystem::remove(tmp);

    gff::write_file(tmp, build_reference());
    CHECK(std::filesystem::file_size(tmp) == 864);

    gff::Header h = gff::read_header_only(tmp);
    CHECK(h.structs.count == 4);

    gff::GffDocument doc = gff::read_file(tmp);
    CHECK(doc.root().get_string("string") == "abcdefghij123456789");

    std::filesystem::remove(tmp);
    CHECK_THROWS_KIND(gff::read_file(tmp), gff::ErrorKind::Io);
}

int main() {
    try {
        test_header();
        test_decoded_values();
        test_reencode_is_byte_identical();
        test_built_document_matches();
        test_file_roundtrip();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
