#include "gff/gff.hpp"
#include "gff_internal.hpp"

#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <utility>

#include <zlib.h>

namespace gff {

using internal::ByteWriter;
using internal::to_u32;

std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large payloads in chunks.
    while (len > 0) {
        uInt chunk = len > 0x40000000u ? 0x40000000u : static_cast<uInt>(len);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), chunk);
        data += chunk;
        len -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

/// Serialized field data payload of an out-of-line value.
static std::vector<std::uint8_t> encode_field_data(const GffValue& v) {
    ByteWriter w;
    switch (static_cast<GffFieldType>(v.index())) {
        case GffFieldType::UInt64:
            w.u64(std::get<std::uint64_t>(v));
            break;
        case GffFieldType::Int64:
            w.i64(std::get<std::int64_t>(v));
            break;
        case GffFieldType::Double:
            w.f64(std::get<double>(v));
            break;
        case GffFieldType::String: {
            const auto& s = std::get<std::string>(v);
            w.u32(to_u32(s.size(), GffRegion::FieldData));
            w.bytes(s.data(), s.size());
            break;
        }
        case GffFieldType::ResRef: {
            const auto& s = std::get<ResRef>(v).str();
            w.u8(static_cast<std::uint8_t>(s.size()));
            w.bytes(s.data(), s.size());
            break;
        }
        case GffFieldType::LocString: {
            const auto& loc = std::get<LocalizedString>(v);
            ByteWriter body;
            body.i32(loc.stringref());
            body.u32(to_u32(loc.size(), GffRegion::FieldData));
            for (const auto& kv : loc.substrings()) {
                body.u32(kv.first);
                body.u32(to_u32(kv.second.size(), GffRegion::FieldData));
                body.bytes(kv.second.data(), kv.second.size());
            }
            w.u32(to_u32(body.size(), GffRegion::FieldData));
            w.bytes(body.data().data(), body.size());
            break;
        }
        case GffFieldType::Binary: {
            const auto& b = std::get<Binary>(v);
            w.u32(to_u32(b.size(), GffRegion::FieldData));
            w.bytes(b.data(), b.size());
            break;
        }
        case GffFieldType::Vector4: {
            const auto& q = std::get<Vector4>(v);
            w.f32(q.x);
            w.f32(q.y);
            w.f32(q.z);
            w.f32(q.w);
            break;
        }
        case GffFieldType::Vector3: {
            const auto& p = std::get<Vector3>(v);
            w.f32(p.x);
            w.f32(p.y);
            w.f32(p.z);
            break;
        }
        default:
            throw GffError(ErrorKind::UnknownType,
                           "type " + to_string(static_cast<GffFieldType>(v.index())) + " is not stored in field data",
                           GffRegion::FieldData);
    }
    return w.take();
}

/// 4-byte slot value of an inline scalar. Signed kinds are sign-extended.
static std::uint32_t encode_inline(const GffValue& v) {
    switch (static_cast<GffFieldType>(v.index())) {
        case GffFieldType::UInt8: return std::get<std::uint8_t>(v);
        case GffFieldType::Int8: return static_cast<std::uint32_t>(static_cast<std::int32_t>(std::get<std::int8_t>(v)));
        case GffFieldType::UInt16: return std::get<std::uint16_t>(v);
        case GffFieldType::Int16: return static_cast<std::uint32_t>(static_cast<std::int32_t>(std::get<std::int16_t>(v)));
        case GffFieldType::UInt32: return std::get<std::uint32_t>(v);
        case GffFieldType::Int32: return static_cast<std::uint32_t>(std::get<std::int32_t>(v));
        case GffFieldType::Single: return internal::float_bits(std::get<float>(v));
        case GffFieldType::StrRef: return static_cast<std::uint32_t>(std::get<StrRef>(v).id);
        default:
            throw GffError(ErrorKind::UnknownType,
                           "type " + to_string(static_cast<GffFieldType>(v.index())) + " is not an inline scalar",
                           GffRegion::Fields);
    }
}

namespace {

class GffWriter {
public:
    explicit GffWriter(const WriteOptions& opts) : opts_(opts) {}

    std::vector<std::uint8_t> write(const GffDocument& doc) {
        internal::check_version(opts_.version, true);

        write_struct(doc.root());

        Header h;
        h.content_tag = doc.content_tag();
        h.version = opts_.version;

        std::size_t offset = kHeaderSize;
        h.structs = {to_u32(offset, GffRegion::Structs), struct_count_};
        offset += structs_.size();
        h.fields = {to_u32(offset, GffRegion::Fields), field_count_};
        offset += fields_.size();
        h.labels = {to_u32(offset, GffRegion::Labels), to_u32(labels_.size(), GffRegion::Labels)};
        offset += labels_.size() * kLabelEntrySize;
        h.field_data = {to_u32(offset, GffRegion::FieldData), to_u32(field_data_.size(), GffRegion::FieldData)};
        offset += field_data_.size();
        h.field_indices = {to_u32(offset, GffRegion::FieldIndices),
                           to_u32(field_indices_.size(), GffRegion::FieldIndices)};
        offset += field_indices_.size();
        h.list_indices = {to_u32(offset, GffRegion::ListIndices),
                          to_u32(list_indices_.size(), GffRegion::ListIndices)};
        offset += list_indices_.size();

        std::vector<std::uint8_t> out = encode_header(h);
        out.reserve(offset);
        append(out, structs_);
        append(out, fields_);
        for (const auto& label : labels_) {
            char padded[kLabelEntrySize] = {};
            std::memcpy(padded, label.data(), label.size());
            out.insert(out.end(), padded, padded + kLabelEntrySize);
        }
        append(out, field_data_);
        append(out, field_indices_);
        append(out, list_indices_);
        return out;
    }

private:
    static void append(std::vector<std::uint8_t>& out, const ByteWriter& w) {
        out.insert(out.end(), w.data().begin(), w.data().end());
    }

    // ------------------------------
    // Tree walk
    // ------------------------------

    void write_struct(const GffStruct& s) {
        ++struct_count_;
        const std::uint32_t field_count = to_u32(s.size(), GffRegion::Structs);

        structs_.i32(s.type_id());
        if (field_count == 0) {
            structs_.u32(kNoFieldsSlot);
            structs_.u32(0);
            return;
        }
        if (field_count == 1) {
            // Single field: the slot holds the field index itself.
            structs_.u32(field_count_);
            structs_.u32(1);
            write_field(s.fields().front());
            return;
        }

        const std::size_t indices_at = field_indices_.size();
        structs_.u32(to_u32(indices_at, GffRegion::FieldIndices));
        structs_.u32(field_count);
        field_indices_.zeros(static_cast<std::size_t>(field_count) * 4u);
        std::size_t i = 0;
        for (const auto& f : s) {
            field_indices_.patch_u32(indices_at + i * 4u, field_count_);
            write_field(f);
            ++i;
        }
    }

    void write_list(const GffList& list) {
        list_indices_.u32(to_u32(list.size(), GffRegion::ListIndices));
        const std::size_t slots_at = list_indices_.size();
        list_indices_.zeros(list.size() * 4u);
        for (std::size_t i = 0; i < list.size(); ++i) {
            list_indices_.patch_u32(slots_at + i * 4u, struct_count_);
            write_struct(list[i]);
        }
    }

    void write_field(const GffField& f) {
        ++field_count_;
        const GffFieldType type = f.type();

        fields_.u32(static_cast<std::uint32_t>(type));
        fields_.u32(label_index(f.label()));

        switch (type) {
            case GffFieldType::Struct:
                // The child takes the next struct index.
                fields_.u32(struct_count_);
                write_struct(std::get<GffStruct>(f.value));
                break;
            case GffFieldType::List:
                fields_.u32(to_u32(list_indices_.size(), GffRegion::ListIndices));
                write_list(std::get<GffList>(f.value));
                break;
            default:
                if (is_inline(type)) {
                    fields_.u32(encode_inline(f.value));
                } else {
                    fields_.u32(store_field_data(encode_field_data(f.value)));
                }
                break;
        }
    }

    // ------------------------------
    // Tables
    // ------------------------------

    std::uint32_t label_index(const std::string& label) {
        auto it = label_lookup_.find(label);
        if (it != label_lookup_.end()) return it->second;
        // GffStruct only holds labels that passed validate_label.
        const std::uint32_t index = to_u32(labels_.size(), GffRegion::Labels);
        labels_.push_back(label);
        label_lookup_.emplace(label, index);
        return index;
    }

    std::uint32_t store_field_data(const std::vector<std::uint8_t>& payload) {
        std::uint32_t crc = 0;
        if (opts_.dedupe_field_data) {
            crc = crc32_bytes(payload.data(), payload.size());
            auto range = payload_lookup_.equal_range(crc);
            for (auto it = range.first; it != range.second; ++it) {
                const StoredPayload& prev = it->second;
                if (prev.size == payload.size() &&
                    std::equal(payload.begin(), payload.end(), field_data_.data().begin() + prev.offset)) {
                    return prev.offset;
                }
            }
        }

        const std::uint32_t offset = to_u32(field_data_.size(), GffRegion::FieldData);
        field_data_.bytes(payload.data(), payload.size());
        if (opts_.dedupe_field_data) {
            payload_lookup_.emplace(crc, StoredPayload{offset, payload.size()});
        }
        return offset;
    }

    struct StoredPayload {
        std::uint32_t offset;
        std::size_t size;
    };

    WriteOptions opts_;

    ByteWriter structs_;
    ByteWriter fields_;
    ByteWriter field_data_;
    ByteWriter field_indices_;
    ByteWriter list_indices_;

    std::vector<std::string> labels_{};
    std::unordered_map<std::string, std::uint32_t> label_lookup_{};
    std::unordered_multimap<std::uint32_t, StoredPayload> payload_lookup_{}; // keyed by crc32

    std::uint32_t struct_count_{0};
    std::uint32_t field_count_{0};
};

} // namespace

std::vector<std::uint8_t> encode(const GffDocument& doc, const WriteOptions& opts) {
    GffWriter writer(opts);
    return writer.write(doc);
}

} // namespace gff
