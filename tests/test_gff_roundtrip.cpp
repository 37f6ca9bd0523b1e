#include "gff/gff.hpp"
#include "gff/gff_easy.hpp"
#include "test_util.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

static gff::GffDocument make_all_kinds() {
    gff::GffDocument doc(gff::GffContent::UTI);
    gff::GffStruct& root = doc.root();

    root.set_uint8("u8", 200);
    root.set_int8("i8", -5);
    root.set_uint16("u16", 60000);
    root.set_int16("i16", -1234);
    root.set_uint32("u32", 0xDEADBEEFu);
    root.set_int32("i32", -42);
    root.set_uint64("u64", std::numeric_limits<std::uint64_t>::max());
    root.set_int64("i64", std::numeric_limits<std::int64_t>::min());
    root.set_single("f32", -0.5f);
    root.set_double("f64", 3.141592653589793);
    root.set_string("str", "line one\nline two");
    root.set_resref("ref", gff::ResRef("g_w_lghtsbr01"));
    root.set_locstring("loc", gff::easy::make_locstring("Lightsaber"));
    root.set_binary("bin", gff::Binary{0x00, 0xFF, 0x10, 0x80});
    gff::GffStruct& props = root.set_struct("props", gff::GffStruct(3));
    props.set_uint16("PropertyName", 45);
    props.set_uint8("CostValue", 2);
    root.set_list("list", {});
    root.set_vector4("quat", gff::Vector4{0.0f, 0.0f, 0.7071f, 0.7071f});
    root.set_vector3("vec", gff::Vector3{-1.0f, 2.5f, 100.0f});
    root.set_strref("sref", gff::StrRef{12345});
    return doc;
}

static void test_scenario() {
    gff::GffDocument doc;
    CHECK(doc.root().type_id() == -1);
    doc.root().set_string("Tag", "mytag");
    doc.root().set_struct("Inner", gff::GffStruct()).set_int32("Value", 42);

    gff::GffDocument decoded = gff::decode(gff::encode(doc));
    CHECK(decoded.root().get_string("Tag") == "mytag");
    CHECK(decoded.root().get_struct("Inner").get_int32("Value") == 42);
}

static void test_all_kinds() {
    gff::GffDocument doc = make_all_kinds();
    CHECK(doc.root().size() == gff::kFieldTypeCount);

    // Every wire tag is present exactly once.
    std::vector<bool> seen(gff::kFieldTypeCount, false);
    for (const auto& f : doc.root()) seen[static_cast<std::size_t>(f.type())] = true;
    for (bool s : seen) CHECK(s);

    const std::vector<std::uint8_t> bytes = gff::encode(doc);
    gff::GffDocument back = gff::decode(bytes);
    CHECK(back == doc);
    CHECK(back.content_tag() == "UTI ");

    const gff::GffStruct& r = back.root();
    CHECK(r.get_int8("i8") == -5);
    CHECK(r.get_int16("i16") == -1234);
    CHECK(r.get_int32("i32") == -42);
    CHECK(r.get_int64("i64") == std::numeric_limits<std::int64_t>::min());
    CHECK(r.get_uint64("u64") == std::numeric_limits<std::uint64_t>::max());
    CHECK(r.get_single("f32") == -0.5f);
    CHECK(r.get_string("str") == "line one\nline two");
    CHECK(r.get_strref("sref").id == 12345);
    CHECK(r.get_list("list").empty());
    CHECK(r.get_struct("props").type_id() == 3);

    // Encoding is a pure function of the tree.
    CHECK(gff::encode(back) == bytes);
}

static void test_dedupe() {
    gff::GffDocument doc;
    gff::GffList& list = doc.root().set_list("Entries", {});
    for (int i = 0; i < 4; ++i) {
        gff::GffStruct& s = gff::easy::append_struct(list, i);
        s.set_string("Tag", "SAME_TAG");
        s.set_uint64("Big", 77);
    }

    gff::WriteOptions dedupe;
    gff::WriteOptions plain;
    plain.dedupe_field_data = false;

    const std::vector<std::uint8_t> a = gff::encode(doc, dedupe);
    const std::vector<std::uint8_t> b = gff::encode(doc, plain);

    // "SAME_TAG" = 4 + 8 bytes, u64 = 8 bytes.
    CHECK(gff::read_header(a).field_data.count == 20);
    CHECK(gff::read_header(b).field_data.count == 4 * 20);
    CHECK(a.size() < b.size());

    gff::GffDocument da = gff::decode(a);
    gff::GffDocument db = gff::decode(b);
    CHECK(da == doc);
    CHECK(db == doc);

    // Shared offsets never alias after decode.
    da.root().get_list("Entries")[0].set_string("Tag", "CHANGED");
    CHECK(da.root().get_list("Entries")[1].get_string("Tag") == "SAME_TAG");
}

static void test_struct_shapes() {
    gff::GffDocument doc;
    gff::GffStruct& root = doc.root();
    root.set_struct("Empty", gff::GffStruct(1));
    root.set_struct("One", gff::GffStruct(2)).set_uint8("Only", 9);

    root.set_list("None", {});
    gff::GffList& single = root.set_list("Single", {});
    gff::easy::append_struct(single, 20).set_int32("X", 1);
    gff::GffList& many = root.set_list("Many", {});
    for (int i = 0; i < 10; ++i) {
        gff::easy::append_struct(many, 100 + i).set_int32("X", i);
    }

    const std::vector<std::uint8_t> bytes = gff::encode(doc);
    const gff::Header h = gff::read_header(bytes);

    // Root(5 fields) uses field indices; the one-field struct stores its field inline.
    CHECK(h.field_indices.count == 5 * 4);
    // Three lists: counts + 0 + 1 + 10 entries.
    CHECK(h.list_indices.count == (3 + 0 + 1 + 10) * 4);

    // Struct 1 is "Empty": no fields, data slot 0xFFFFFFFF.
    const std::size_t empty_at = h.structs.offset + 12;
    CHECK(bytes[empty_at + 4] == 0xFF && bytes[empty_at + 7] == 0xFF);
    CHECK(bytes[empty_at + 8] == 0);

    gff::GffDocument back = gff::decode(bytes);
    CHECK(back == doc);
    CHECK(back.root().get_struct("Empty").empty());
    CHECK(back.root().get_struct("Empty").type_id() == 1);
    CHECK(back.root().get_struct("One").get_uint8("Only") == 9);
    CHECK(back.root().get_list("None").empty());
    CHECK(back.root().get_list("Single").size() == 1);
    const gff::GffList& m = back.root().get_list("Many");
    CHECK(m.size() == 10);
    for (int i = 0; i < 10; ++i) {
        CHECK(m[static_cast<std::size_t>(i)].type_id() == 100 + i);
        CHECK(m[static_cast<std::size_t>(i)].get_int32("X") == i);
    }
}

static void test_label_boundary() {
    gff::GffDocument doc;
    const std::string sixteen = "ABCDEFGHIJKLMNOP";
    doc.root().set_uint8(sixteen, 1);
    CHECK_THROWS_KIND(doc.root().set_uint8(sixteen + "Q", 1), gff::ErrorKind::LabelTooLong);
    CHECK(doc.root().size() == 1);

    gff::GffDocument back = gff::decode(gff::encode(doc));
    CHECK(back.root().fields().front().label() == sixteen);
    CHECK(back.root().get_uint8(sixteen) == 1);

    // Labels are shared across structs.
    gff::GffList& list = doc.root().set_list("L", {});
    gff::easy::append_struct(list, 0).set_uint8(sixteen, 2);
    gff::easy::append_struct(list, 0).set_uint8(sixteen, 3);
    CHECK(gff::read_header(gff::encode(doc)).labels.count == 2);
}

static void test_locstring_ids() {
    gff::GffDocument doc;
    gff::LocalizedString loc;
    loc.set_by_id(0, "english male");
    loc.set_by_id(3, "french female");
    loc.set_by_id(9, "spanish female");
    CHECK(loc.stringref() == -1);
    doc.root().set_locstring("Name", loc);

    gff::LocalizedString ref(-7);
    CHECK(ref.stringref() == gff::LocalizedString::kNoStringRef);
    doc.root().set_locstring("Ref", gff::LocalizedString(5000));

    gff::GffDocument back = gff::decode(gff::encode(doc));
    const gff::LocalizedString& got = back.root().get_locstring("Name");
    CHECK(got.size() == 3);
    CHECK(got.get_by_id(0) == std::string("english male"));
    CHECK(got.get(gff::Language::French, gff::Gender::Female) == std::string("french female"));
    CHECK(got.get(gff::Language::Spanish, gff::Gender::Female) == std::string("spanish female"));
    CHECK(!got.get_by_id(1).has_value());
    CHECK(!got.has_stringref());
    CHECK(back.root().get_locstring("Ref").stringref() == 5000);
    CHECK(back.root().get_locstring("Ref").empty());
}

static void test_file_io() {
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "gff_cpp_roundtrip.uti";
    std::filesystem::remove(tmp);

    gff::GffDocument doc = make_all_kinds();
    gff::write_file(tmp, doc);

    gff::Header h = gff::read_header_only(tmp);
    CHECK(h.content_tag == "UTI ");
    CHECK(h.version == "V3.2");
    CHECK(gff::read_file(tmp) == doc);

    gff::WriteOptions v33;
    v33.version = "V3.3";
    gff::write_file(tmp, doc, v33);
    CHECK(gff::read_bytes(tmp) == gff::encode(doc, v33));
    CHECK(gff::read_header_only(tmp).version == "V3.3");
    CHECK(gff::read_file(tmp) == doc);

    gff::WriteOptions bad;
    bad.version = "V4.0";
    CHECK_THROWS_KIND(gff::encode(doc, bad), gff::ErrorKind::UnsupportedVersion);

    std::filesystem::remove(tmp);
    CHECK_THROWS_KIND(gff::read_bytes(tmp), gff::ErrorKind::Io);

    // Standard CRC-32 check value.
    const std::string check = "123456789";
    CHECK(gff::crc32_bytes(reinterpret_cast<const std::uint8_t*>(check.data()), check.size()) == 0xCBF43926u);
    CHECK(gff::crc32_bytes(nullptr, 0) == 0);
}

int main() {
    try {
        test_scenario();
        test_all_kinds();
        test_dedupe();
        test_struct_shapes();
        test_label_boundary();
        test_locstring_ids();
        test_file_io();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
