#include "gff/gff.hpp"
#include "gff_internal.hpp"

#include <array>
#include <cctype>

namespace gff {

namespace internal {

void check_version(const std::string& version, bool allow_v33) {
    if (version == "V3.2") return;
    if (allow_v33 && version == "V3.3") return;
    std::string shown;
    for (unsigned char c : version) {
        shown.push_back(std::isprint(c) ? static_cast<char>(c) : '?');
    }
    throw GffError(ErrorKind::UnsupportedVersion, "unsupported GFF version '" + shown + "'", GffRegion::Header);
}

void check_regions(const Header& h, std::uint64_t size) {
    struct Span {
        const RegionSpan* span;
        std::uint64_t elem_size;
        GffRegion region;
    };
    const std::array<Span, 6> spans{{
        {&h.structs, kStructEntrySize, GffRegion::Structs},
        {&h.fields, kFieldEntrySize, GffRegion::Fields},
        {&h.labels, kLabelEntrySize, GffRegion::Labels},
        {&h.field_data, 1, GffRegion::FieldData},
        {&h.field_indices, 1, GffRegion::FieldIndices},
        {&h.list_indices, 1, GffRegion::ListIndices},
    }};

    for (const auto& s : spans) {
        // u32 * 16 cannot overflow u64.
        std::uint64_t len = static_cast<std::uint64_t>(s.span->count) * s.elem_size;
        if (!fits(s.span->offset, len, size)) {
            throw GffError(ErrorKind::Truncated,
                           "the " + to_string(s.region) + " region (offset " + std::to_string(s.span->offset) +
                           ", " + std::to_string(len) + " bytes) extends past the end of the " +
                           std::to_string(size) + "-byte buffer",
                           s.region);
        }
    }
}

} // namespace internal

static RegionSpan read_span(internal::ByteReader& r) {
    RegionSpan s;
    s.offset = r.u32();
    s.count = r.u32();
    return s;
}

static void write_span(internal::ByteWriter& w, const RegionSpan& s) {
    w.u32(s.offset);
    w.u32(s.count);
}

Header read_header(const std::uint8_t* data, std::size_t size, const ReadOptions& opts) {
    if (size < kHeaderSize) {
        throw GffError(ErrorKind::Truncated,
                       "buffer of " + std::to_string(size) + " bytes is too small for the " +
                       std::to_string(kHeaderSize) + "-byte header",
                       GffRegion::Header);
    }

    internal::ByteReader r(data, kHeaderSize, GffRegion::Header);
    Header h;
    h.content_tag = r.str(4);
    h.version = r.str(4);
    internal::check_version(h.version, opts.allow_v33);

    h.structs = read_span(r);
    h.fields = read_span(r);
    h.labels = read_span(r);
    h.field_data = read_span(r);
    h.field_indices = read_span(r);
    h.list_indices = read_span(r);

    internal::check_regions(h, size);

    if (h.field_indices.count % 4 != 0) {
        throw GffError(ErrorKind::BadFormat, "field indices size is not a multiple of 4", GffRegion::FieldIndices);
    }
    if (h.list_indices.count % 4 != 0) {
        throw GffError(ErrorKind::BadFormat, "list indices size is not a multiple of 4", GffRegion::ListIndices);
    }
    return h;
}

Header read_header(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts) {
    return read_header(bytes.data(), bytes.size(), opts);
}

std::vector<std::uint8_t> encode_header(const Header& header) {
    if (header.content_tag.size() != 4) {
        throw GffError(ErrorKind::BadFormat, "content tag must be exactly 4 bytes", GffRegion::Header);
    }
    if (header.version.size() != 4) {
        throw GffError(ErrorKind::UnsupportedVersion, "version tag must be exactly 4 bytes", GffRegion::Header);
    }

    internal::ByteWriter w;
    w.bytes(header.content_tag.data(), 4);
    w.bytes(header.version.data(), 4);
    write_span(w, header.structs);
    write_span(w, header.fields);
    write_span(w, header.labels);
    write_span(w, header.field_data);
    write_span(w, header.field_indices);
    write_span(w, header.list_indices);
    return w.take();
}

} // namespace gff
