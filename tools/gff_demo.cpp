#include "gff/gff_easy.hpp"

#include <cstdint>
#include <iostream>
#include <string>


int main() {
    try {
        using namespace gff;

        // A small creature template
        GffDocument doc(GffContent::UTC);
        GffStruct& root = doc.root();

        root.set_resref("TemplateResRef", ResRef("n_commoner01"));
        root.set_string("Tag", "COMMONER_01");
        root.set_locstring("FirstName", easy::make_locstring("Commoner"));
        root.set_locstring("LastName", easy::make_locstring(std::int32_t{31845}));
        root.set_uint8("Race", 6);
        root.set_int16("HitPoints", 12);
        root.set_single("ChallengeRating", 0.25f);
        root.set_vector3("Position", Vector3{10.0f, 4.5f, 0.0f});

        // Inventory list, one struct per item
        GffList& items = root.set_list("ItemList", {});
        for (std::uint16_t i = 0; i < 3; ++i) {
            GffStruct& item = easy::append_struct(items, i);
            item.set_resref("InventoryRes", ResRef("g_i_credits00" + std::to_string(i + 1)));
            item.set_uint16("Repos_PosX", i);
            item.set_uint16("Repos_PosY", 0);
        }

        GffStruct& stats = root.set_struct("Stats", GffStruct(7));
        stats.set_uint8("Str", 12);
        stats.set_uint8("Dex", 10);

        // Write
        std::string file = "demo_out.utc";
        write_file(file, doc);
        std::cout << "Wrote: " << file << "\n";

        // Read back and look a few fields up by path
        GffDocument back = read_file(file);
        std::cout << "Content: '" << back.content_tag() << "'\n";

        const GffField& res = easy::find_field(back.root(), "ItemList\\2\\InventoryRes");
        std::cout << "ItemList\\2\\InventoryRes = " << to_display_string(res.value) << "\n";

        const GffStruct& s = easy::find_struct(back.root(), "Stats");
        std::cout << "Stats type=" << s.type_id() << " Str=" << static_cast<int>(s.get_uint8("Str")) << "\n";

        bool same = doc.compare(back, [](const std::string& line) { std::cout << "  diff: " << line << "\n"; });
        std::cout << (same ? "OK\n" : "MISMATCH\n");
        return same ? 0 : 1;

    } catch (const gff::GffError& e) {
        std::cerr << "GFF error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
