#include "gff/gff.hpp"
#include "gff_internal.hpp"

#include <utility>

namespace gff {

namespace {

using internal::ByteReader;

// Nesting deeper than this is rejected instead of exhausting the stack.
constexpr std::size_t kMaxDepth = 4096;

// A struct reachable from several parents is copied once per parent. The
// decoded tree may hold at most this many nodes per struct and field entry
// on the wire, so a small file cannot expand exponentially.
constexpr std::size_t kMaxExpansion = 16;

struct StructEntry {
    std::int32_t type_id{0};
    std::uint32_t data_or_offset{0};
    std::uint32_t field_count{0};
};

struct FieldEntry {
    std::uint32_t type{0};
    std::uint32_t label_index{0};
    std::uint32_t data_or_offset{0};
};

class GffReader {
public:
    GffReader(const std::uint8_t* data, std::size_t size, const ReadOptions& opts)
        : data_(data), size_(size), opts_(opts) {}

    GffDocument read() {
        header_ = read_header(data_, size_, opts_);
        read_structs();
        read_fields();
        read_labels();

        if (structs_.empty()) {
            throw GffError(ErrorKind::BadFormat, "document has no root struct", GffRegion::Structs);
        }

        active_.assign(structs_.size(), false);
        node_limit_ = (structs_.size() + fields_.size()) * kMaxExpansion;
        nodes_ = 0;

        GffDocument doc(header_.content_tag);
        doc.root() = build_struct(0, 0);
        return doc;
    }

private:
    ByteReader region(const RegionSpan& span, std::size_t elem_size, GffRegion r) const {
        // read_header already checked the span against the buffer.
        return ByteReader(data_ + span.offset, static_cast<std::size_t>(span.count) * elem_size, r);
    }

    void read_structs() {
        ByteReader r = region(header_.structs, kStructEntrySize, GffRegion::Structs);
        structs_.resize(header_.structs.count);
        for (auto& s : structs_) {
            s.type_id = r.i32();
            s.data_or_offset = r.u32();
            s.field_count = r.u32();
        }
    }

    void read_fields() {
        ByteReader r = region(header_.fields, kFieldEntrySize, GffRegion::Fields);
        fields_.resize(header_.fields.count);
        for (auto& f : fields_) {
            f.type = r.u32();
            f.label_index = r.u32();
            f.data_or_offset = r.u32();
        }
    }

    void read_labels() {
        ByteReader r = region(header_.labels, kLabelEntrySize, GffRegion::Labels);
        labels_.reserve(header_.labels.count);
        for (std::uint32_t i = 0; i < header_.labels.count; ++i) {
            std::string raw = r.str(kLabelEntrySize);
            auto nul = raw.find('\0');
            if (nul == std::string::npos) {
                labels_.push_back(std::move(raw));
                continue;
            }
            if (opts_.strict_labels && raw.find_first_not_of('\0', nul) != std::string::npos) {
                throw GffError(ErrorKind::BadFormat,
                               "label " + std::to_string(i) + " has data after its NUL padding",
                               GffRegion::Labels);
            }
            raw.resize(nul);
            labels_.push_back(std::move(raw));
        }
    }

    // ------------------------------
    // Tree builder
    // ------------------------------

    void count_node() {
        if (++nodes_ > node_limit_) {
            throw GffError(ErrorKind::BadFormat,
                           "shared structs expand past " + std::to_string(node_limit_) +
                           " decoded structs and fields",
                           GffRegion::Structs);
        }
    }

    GffStruct build_struct(std::uint32_t index, std::size_t depth) {
        if (index >= structs_.size()) {
            throw GffError(ErrorKind::OffsetRange,
                           "struct index " + std::to_string(index) + " is outside the struct array (" +
                           std::to_string(structs_.size()) + " entries)",
                           GffRegion::Structs);
        }
        if (active_[index]) {
            throw GffError(ErrorKind::BadFormat,
                           "struct " + std::to_string(index) + " contains itself", GffRegion::Structs);
        }
        if (depth > kMaxDepth) {
            throw GffError(ErrorKind::BadFormat, "struct nesting is deeper than " + std::to_string(kMaxDepth),
                           GffRegion::Structs);
        }
        count_node();
        active_[index] = true;

        const StructEntry& e = structs_[index];
        GffStruct out(e.type_id);

        if (e.field_count == 1) {
            read_field(out, e.data_or_offset, depth);
        } else if (e.field_count > 1) {
            ByteReader r = region(header_.field_indices, 1, GffRegion::FieldIndices);
            if (!internal::fits(e.data_or_offset, static_cast<std::uint64_t>(e.field_count) * 4u, r.size())) {
                throw GffError(ErrorKind::OffsetRange,
                               "struct " + std::to_string(index) + " field indices (offset " +
                               std::to_string(e.data_or_offset) + ", " + std::to_string(e.field_count) +
                               " fields) fall outside the field indices region",
                               GffRegion::FieldIndices);
            }
            r.seek(e.data_or_offset);
            for (std::uint32_t i = 0; i < e.field_count; ++i) {
                read_field(out, r.u32(), depth);
            }
        }

        active_[index] = false;
        return out;
    }

    GffList build_list(std::uint32_t offset, std::size_t depth) {
        ByteReader r = region(header_.list_indices, 1, GffRegion::ListIndices);
        if (!internal::fits(offset, 4, r.size())) {
            throw GffError(ErrorKind::OffsetRange,
                           "list offset " + std::to_string(offset) + " is outside the list indices region (" +
                           std::to_string(r.size()) + " bytes)",
                           GffRegion::ListIndices);
        }
        r.seek(offset);
        std::uint32_t count = r.u32();
        if (static_cast<std::uint64_t>(count) * 4u > r.remaining()) {
            throw GffError(ErrorKind::OffsetRange,
                           "list at offset " + std::to_string(offset) + " declares " + std::to_string(count) +
                           " entries, past the end of the list indices region",
                           GffRegion::ListIndices);
        }

        GffList list;
        list.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            list.push_back(build_struct(r.u32(), depth + 1));
        }
        return list;
    }

    void read_field(GffStruct& into, std::uint32_t field_index, std::size_t depth) {
        if (field_index >= fields_.size()) {
            throw GffError(ErrorKind::OffsetRange,
                           "field index " + std::to_string(field_index) + " is outside the field array (" +
                           std::to_string(fields_.size()) + " entries)",
                           GffRegion::Fields);
        }
        count_node();
        const FieldEntry& e = fields_[field_index];
        if (e.label_index >= labels_.size()) {
            throw GffError(ErrorKind::OffsetRange,
                           "field " + std::to_string(field_index) + " label index " +
                           std::to_string(e.label_index) + " is outside the label array",
                           GffRegion::Labels);
        }
        if (e.type >= kFieldTypeCount) {
            throw GffError(ErrorKind::UnknownType,
                           "field " + std::to_string(field_index) + " has unknown type tag " + std::to_string(e.type),
                           GffRegion::Fields);
        }

        const std::string& label = labels_[e.label_index];
        const std::uint32_t slot = e.data_or_offset;

        switch (static_cast<GffFieldType>(e.type)) {
            case GffFieldType::UInt8:
                into.set_uint8(label, static_cast<std::uint8_t>(slot & 0xFFu));
                break;
            case GffFieldType::Int8:
                into.set_int8(label, static_cast<std::int8_t>(static_cast<std::uint8_t>(slot & 0xFFu)));
                break;
            case GffFieldType::UInt16:
                into.set_uint16(label, static_cast<std::uint16_t>(slot & 0xFFFFu));
                break;
            case GffFieldType::Int16:
                into.set_int16(label, static_cast<std::int16_t>(static_cast<std::uint16_t>(slot & 0xFFFFu)));
                break;
            case GffFieldType::UInt32:
                into.set_uint32(label, slot);
                break;
            case GffFieldType::Int32:
                into.set_int32(label, static_cast<std::int32_t>(slot));
                break;
            case GffFieldType::Single:
                into.set_single(label, internal::float_from_bits(slot));
                break;
            case GffFieldType::StrRef:
                into.set_strref(label, StrRef{static_cast<std::int32_t>(slot)});
                break;
            case GffFieldType::Struct:
                into.set_struct(label, build_struct(slot, depth + 1));
                break;
            case GffFieldType::List:
                into.set_list(label, build_list(slot, depth));
                break;
            default:
                read_field_data(into, label, static_cast<GffFieldType>(e.type), slot);
                break;
        }
    }

    // ------------------------------
    // Field data region
    // ------------------------------

    ByteReader field_data_at(std::uint32_t offset, std::size_t fixed_size) const {
        ByteReader r = region(header_.field_data, 1, GffRegion::FieldData);
        if (offset >= r.size() || !internal::fits(offset, fixed_size, r.size())) {
            throw GffError(ErrorKind::OffsetRange,
                           "field data offset " + std::to_string(offset) + " is outside the field data region (" +
                           std::to_string(r.size()) + " bytes)",
                           GffRegion::FieldData);
        }
        r.seek(offset);
        return r;
    }

    void read_field_data(GffStruct& into, const std::string& label, GffFieldType type, std::uint32_t offset) {
        switch (type) {
            case GffFieldType::UInt64:
                into.set_uint64(label, field_data_at(offset, 8).u64());
                break;
            case GffFieldType::Int64:
                into.set_int64(label, field_data_at(offset, 8).i64());
                break;
            case GffFieldType::Double:
                into.set_double(label, field_data_at(offset, 8).f64());
                break;
            case GffFieldType::String: {
                ByteReader r = field_data_at(offset, 4);
                std::uint32_t len = r.u32();
                into.set_string(label, r.str(len));
                break;
            }
            case GffFieldType::ResRef: {
                ByteReader r = field_data_at(offset, 1);
                std::uint8_t len = r.u8();
                into.set_resref(label, ResRef(r.str(len)));
                break;
            }
            case GffFieldType::LocString:
                into.set_locstring(label, read_locstring(field_data_at(offset, 4)));
                break;
            case GffFieldType::Binary: {
                ByteReader r = field_data_at(offset, 4);
                std::uint32_t len = r.u32();
                into.set_binary(label, r.bytes(len));
                break;
            }
            case GffFieldType::Vector4: {
                ByteReader r = field_data_at(offset, 16);
                Vector4 v;
                v.x = r.f32();
                v.y = r.f32();
                v.z = r.f32();
                v.w = r.f32();
                into.set_vector4(label, v);
                break;
            }
            case GffFieldType::Vector3: {
                ByteReader r = field_data_at(offset, 12);
                Vector3 v;
                v.x = r.f32();
                v.y = r.f32();
                v.z = r.f32();
                into.set_vector3(label, v);
                break;
            }
            default:
                throw GffError(ErrorKind::UnknownType,
                               "type " + to_string(type) + " has no field data layout", GffRegion::FieldData);
        }
    }

    static LocalizedString read_locstring(ByteReader r) {
        std::uint32_t total = r.u32();
        // Substrings may not spill past the declared total size.
        ByteReader body = r.sub(total);

        LocalizedString out(body.i32());
        std::uint32_t count = body.u32();
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint32_t id = body.u32();
            std::uint32_t len = body.u32();
            out.set_by_id(id, body.str(len));
        }
        return out;
    }

    const std::uint8_t* data_;
    std::size_t size_;
    ReadOptions opts_;

    Header header_{};
    std::vector<StructEntry> structs_{};
    std::vector<FieldEntry> fields_{};
    std::vector<std::string> labels_{};
    std::vector<bool> active_{};
    std::size_t node_limit_{0};
    std::size_t nodes_{0};
};

} // namespace

GffDocument decode(const std::uint8_t* data, std::size_t size, const ReadOptions& opts) {
    GffReader reader(data, size, opts);
    return reader.read();
}

GffDocument decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts) {
    return decode(bytes.data(), bytes.size(), opts);
}

} // namespace gff
