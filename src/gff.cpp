#include "gff/gff.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>

namespace gff {

GffError::GffError(ErrorKind k, const std::string& msg, GffRegion region)
    : std::runtime_error(msg), kind_(k), region_(region) {}

ErrorKind GffError::kind() const noexcept { return kind_; }

GffRegion GffError::region() const noexcept { return region_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "io";
        case ErrorKind::BadFormat: return "bad format";
        case ErrorKind::UnsupportedVersion: return "unsupported version";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::OffsetRange: return "offset out of range";
        case ErrorKind::UnknownType: return "unknown field type";
        case ErrorKind::LabelTooLong: return "label too long";
        case ErrorKind::ResRefTooLong: return "resref too long";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::NotFound: return "not found";
    }
    return "unknown";
}

std::string to_string(GffRegion r) {
    switch (r) {
        case GffRegion::None: return "none";
        case GffRegion::Header: return "header";
        case GffRegion::Structs: return "struct array";
        case GffRegion::Fields: return "field array";
        case GffRegion::Labels: return "label array";
        case GffRegion::FieldData: return "field data";
        case GffRegion::FieldIndices: return "field indices";
        case GffRegion::ListIndices: return "list indices";
    }
    return "unknown";
}

// ------------------------------
// Field kinds
// ------------------------------

std::string to_string(GffFieldType t) {
    switch (t) {
        case GffFieldType::UInt8: return "UInt8";
        case GffFieldType::Int8: return "Int8";
        case GffFieldType::UInt16: return "UInt16";
        case GffFieldType::Int16: return "Int16";
        case GffFieldType::UInt32: return "UInt32";
        case GffFieldType::Int32: return "Int32";
        case GffFieldType::UInt64: return "UInt64";
        case GffFieldType::Int64: return "Int64";
        case GffFieldType::Single: return "Single";
        case GffFieldType::Double: return "Double";
        case GffFieldType::String: return "String";
        case GffFieldType::ResRef: return "ResRef";
        case GffFieldType::LocString: return "LocString";
        case GffFieldType::Binary: return "Binary";
        case GffFieldType::Struct: return "Struct";
        case GffFieldType::List: return "List";
        case GffFieldType::Vector4: return "Vector4";
        case GffFieldType::Vector3: return "Vector3";
        case GffFieldType::StrRef: return "StrRef";
    }
    return "Unknown";
}

bool is_inline(GffFieldType t) noexcept {
    switch (t) {
        case GffFieldType::UInt8:
        case GffFieldType::Int8:
        case GffFieldType::UInt16:
        case GffFieldType::Int16:
        case GffFieldType::UInt32:
        case GffFieldType::Int32:
        case GffFieldType::Single:
        case GffFieldType::Struct:
        case GffFieldType::List:
        case GffFieldType::StrRef:
            return true;
        default:
            return false;
    }
}

// ------------------------------
// Value types
// ------------------------------

ResRef::ResRef(std::string value) : value_(std::move(value)) {
    if (value_.size() > kMaxResRefLength) {
        throw GffError(ErrorKind::ResRefTooLong,
                       "resref '" + value_ + "' is " + std::to_string(value_.size()) +
                       " bytes (limit " + std::to_string(kMaxResRefLength) + ")");
    }
}

const std::string& ResRef::str() const noexcept { return value_; }

bool ResRef::empty() const noexcept { return value_.empty(); }

bool ResRef::operator==(const ResRef& other) const noexcept { return value_ == other.value_; }

bool ResRef::operator!=(const ResRef& other) const noexcept { return !(*this == other); }

LocalizedString::LocalizedString(std::int32_t stringref) {
    set_stringref(stringref);
}

std::uint32_t LocalizedString::substring_id(Language lang, Gender gender) noexcept {
    return static_cast<std::uint32_t>(lang) * 2u + static_cast<std::uint32_t>(gender);
}

std::pair<Language, Gender> LocalizedString::split_substring_id(std::uint32_t id) noexcept {
    return {static_cast<Language>(id / 2u), static_cast<Gender>(id % 2u)};
}

std::int32_t LocalizedString::stringref() const noexcept { return stringref_; }

void LocalizedString::set_stringref(std::int32_t stringref) noexcept {
    stringref_ = stringref < 0 ? kNoStringRef : stringref;
}

bool LocalizedString::has_stringref() const noexcept { return stringref_ != kNoStringRef; }

void LocalizedString::set(Language lang, Gender gender, std::string text) {
    set_by_id(substring_id(lang, gender), std::move(text));
}

std::optional<std::string> LocalizedString::get(Language lang, Gender gender) const {
    return get_by_id(substring_id(lang, gender));
}

bool LocalizedString::remove(Language lang, Gender gender) {
    return substrings_.erase(substring_id(lang, gender)) != 0;
}

void LocalizedString::set_by_id(std::uint32_t id, std::string text) {
    substrings_[id] = std::move(text);
}

std::optional<std::string> LocalizedString::get_by_id(std::uint32_t id) const {
    auto it = substrings_.find(id);
    if (it == substrings_.end()) return std::nullopt;
    return it->second;
}

std::size_t LocalizedString::size() const noexcept { return substrings_.size(); }

bool LocalizedString::empty() const noexcept { return substrings_.empty(); }

const std::map<std::uint32_t, std::string>& LocalizedString::substrings() const noexcept {
    return substrings_;
}

bool LocalizedString::operator==(const LocalizedString& other) const noexcept {
    return stringref_ == other.stringref_ && substrings_ == other.substrings_;
}

bool LocalizedString::operator!=(const LocalizedString& other) const noexcept { return !(*this == other); }

bool operator==(const Vector3& a, const Vector3& b) noexcept {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

bool operator!=(const Vector3& a, const Vector3& b) noexcept { return !(a == b); }

bool operator==(const Vector4& a, const Vector4& b) noexcept {
    return a.x == b.x && a.y == b.y && a.z == b.z && a.w == b.w;
}

bool operator!=(const Vector4& a, const Vector4& b) noexcept { return !(a == b); }

bool operator==(const StrRef& a, const StrRef& b) noexcept { return a.id == b.id; }

bool operator!=(const StrRef& a, const StrRef& b) noexcept { return !(a == b); }

// ------------------------------
// Struct
// ------------------------------

void validate_label(const std::string& label) {
    if (label.size() > kMaxLabelLength) {
        throw GffError(ErrorKind::LabelTooLong,
                       "label '" + label + "' is " + std::to_string(label.size()) +
                       " bytes (limit " + std::to_string(kMaxLabelLength) + ")");
    }
    if (label.find('\0') != std::string::npos) {
        throw GffError(ErrorKind::BadFormat, "label contains a NUL byte");
    }
}

GffStruct::GffStruct() = default;

GffStruct::GffStruct(std::int32_t type_id) : type_id_(type_id) {}

GffStruct::GffStruct(const GffStruct& other) = default;

GffStruct::GffStruct(GffStruct&& other) noexcept = default;

GffStruct& GffStruct::operator=(const GffStruct& other) = default;

GffStruct& GffStruct::operator=(GffStruct&& other) noexcept = default;

GffStruct::~GffStruct() = default;

std::int32_t GffStruct::type_id() const noexcept { return type_id_; }

void GffStruct::set_type_id(std::int32_t type_id) noexcept { type_id_ = type_id; }

std::size_t GffStruct::size() const noexcept { return fields_.size(); }

bool GffStruct::empty() const noexcept { return fields_.empty(); }

bool GffStruct::exists(const std::string& label) const { return field(label) != nullptr; }

std::optional<GffFieldType> GffStruct::type_of(const std::string& label) const {
    const GffField* f = field(label);
    if (!f) return std::nullopt;
    return f->type();
}

const GffField* GffStruct::field(const std::string& label) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const GffField& f) { return f.label() == label; });
    return it == fields_.end() ? nullptr : &*it;
}

GffField* GffStruct::field(const std::string& label) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const GffField& f) { return f.label() == label; });
    return it == fields_.end() ? nullptr : &*it;
}

bool GffStruct::remove(const std::string& label) {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const GffField& f) { return f.label() == label; });
    if (it == fields_.end()) return false;
    fields_.erase(it);
    return true;
}

void GffStruct::rename(const std::string& from, const std::string& to) {
    GffField* f = field(from);
    if (!f) {
        throw GffError(ErrorKind::NotFound, "field '" + from + "' not found");
    }
    if (from == to) return;
    validate_label(to);
    if (exists(to)) {
        throw GffError(ErrorKind::BadFormat, "cannot rename '" + from + "': label '" + to + "' is already used");
    }
    f->label_ = to;
}

const std::vector<GffField>& GffStruct::fields() const noexcept { return fields_; }

std::vector<GffField>::const_iterator GffStruct::begin() const noexcept { return fields_.begin(); }

std::vector<GffField>::const_iterator GffStruct::end() const noexcept { return fields_.end(); }

template <std::size_t I, typename V>
auto& GffStruct::emplace(const std::string& label, V&& v) {
    validate_label(label);
    GffField* f = field(label);
    if (!f) {
        fields_.push_back(GffField(label));
        f = &fields_.back();
    }
    return f->value.template emplace<I>(std::forward<V>(v));
}

namespace {

template <GffFieldType T, typename F>
auto& checked_get(F* f, const std::string& label) {
    if (!f) {
        throw GffError(ErrorKind::NotFound, "field '" + label + "' not found");
    }
    if (f->type() != T) {
        throw GffError(ErrorKind::TypeMismatch,
                       "field '" + label + "' is " + to_string(f->type()) +
                       ", requested " + to_string(T));
    }
    return std::get<static_cast<std::size_t>(T)>(f->value);
}

} // namespace

std::uint8_t GffStruct::get_uint8(const std::string& label) const {
    return checked_get<GffFieldType::UInt8>(field(label), label);
}

std::int8_t GffStruct::get_int8(const std::string& label) const {
    return checked_get<GffFieldType::Int8>(field(label), label);
}

std::uint16_t GffStruct::get_uint16(const std::string& label) const {
    return checked_get<GffFieldType::UInt16>(field(label), label);
}

std::int16_t GffStruct::get_int16(const std::string& label) const {
    return checked_get<GffFieldType::Int16>(field(label), label);
}

std::uint32_t GffStruct::get_uint32(const std::string& label) const {
    return checked_get<GffFieldType::UInt32>(field(label), label);
}

std::int32_t GffStruct::get_int32(const std::string& label) const {
    return checked_get<GffFieldType::Int32>(field(label), label);
}

std::uint64_t GffStruct::get_uint64(const std::string& label) const {
    return checked_get<GffFieldType::UInt64>(field(label), label);
}

std::int64_t GffStruct::get_int64(const std::string& label) const {
    return checked_get<GffFieldType::Int64>(field(label), label);
}

float GffStruct::get_single(const std::string& label) const {
    return checked_get<GffFieldType::Single>(field(label), label);
}

double GffStruct::get_double(const std::string& label) const {
    return checked_get<GffFieldType::Double>(field(label), label);
}

const std::string& GffStruct::get_string(const std::string& label) const {
    return checked_get<GffFieldType::String>(field(label), label);
}

const ResRef& GffStruct::get_resref(const std::string& label) const {
    return checked_get<GffFieldType::ResRef>(field(label), label);
}

const LocalizedString& GffStruct::get_locstring(const std::string& label) const {
    return checked_get<GffFieldType::LocString>(field(label), label);
}

const Binary& GffStruct::get_binary(const std::string& label) const {
    return checked_get<GffFieldType::Binary>(field(label), label);
}

const GffStruct& GffStruct::get_struct(const std::string& label) const {
    return checked_get<GffFieldType::Struct>(field(label), label);
}

GffStruct& GffStruct::get_struct(const std::string& label) {
    return checked_get<GffFieldType::Struct>(field(label), label);
}

const GffList& GffStruct::get_list(const std::string& label) const {
    return checked_get<GffFieldType::List>(field(label), label);
}

GffList& GffStruct::get_list(const std::string& label) {
    return checked_get<GffFieldType::List>(field(label), label);
}

Vector4 GffStruct::get_vector4(const std::string& label) const {
    return checked_get<GffFieldType::Vector4>(field(label), label);
}

Vector3 GffStruct::get_vector3(const std::string& label) const {
    return checked_get<GffFieldType::Vector3>(field(label), label);
}

StrRef GffStruct::get_strref(const std::string& label) const {
    return checked_get<GffFieldType::StrRef>(field(label), label);
}

void GffStruct::set_uint8(const std::string& label, std::uint8_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::UInt8)>(label, v);
}

void GffStruct::set_int8(const std::string& label, std::int8_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::Int8)>(label, v);
}

void GffStruct::set_uint16(const std::string& label, std::uint16_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::UInt16)>(label, v);
}

void GffStruct::set_int16(const std::string& label, std::int16_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::Int16)>(label, v);
}

void GffStruct::set_uint32(const std::string& label, std::uint32_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::UInt32)>(label, v);
}

void GffStruct::set_int32(const std::string& label, std::int32_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::Int32)>(label, v);
}

void GffStruct::set_uint64(const std::string& label, std::uint64_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::UInt64)>(label, v);
}

void GffStruct::set_int64(const std::string& label, std::int64_t v) {
    emplace<static_cast<std::size_t>(GffFieldType::Int64)>(label, v);
}

void GffStruct::set_single(const std::string& label, float v) {
    emplace<static_cast<std::size_t>(GffFieldType::Single)>(label, v);
}

void GffStruct::set_double(const std::string& label, double v) {
    emplace<static_cast<std::size_t>(GffFieldType::Double)>(label, v);
}

void GffStruct::set_string(const std::string& label, std::string v) {
    emplace<static_cast<std::size_t>(GffFieldType::String)>(label, std::move(v));
}

void GffStruct::set_resref(const std::string& label, ResRef v) {
    emplace<static_cast<std::size_t>(GffFieldType::ResRef)>(label, std::move(v));
}

void GffStruct::set_locstring(const std::string& label, LocalizedString v) {
    emplace<static_cast<std::size_t>(GffFieldType::LocString)>(label, std::move(v));
}

void GffStruct::set_binary(const std::string& label, Binary v) {
    emplace<static_cast<std::size_t>(GffFieldType::Binary)>(label, std::move(v));
}

GffStruct& GffStruct::set_struct(const std::string& label, GffStruct v) {
    return emplace<static_cast<std::size_t>(GffFieldType::Struct)>(label, std::move(v));
}

GffList& GffStruct::set_list(const std::string& label, GffList v) {
    return emplace<static_cast<std::size_t>(GffFieldType::List)>(label, std::move(v));
}

void GffStruct::set_vector4(const std::string& label, const Vector4& v) {
    emplace<static_cast<std::size_t>(GffFieldType::Vector4)>(label, v);
}

void GffStruct::set_vector3(const std::string& label, const Vector3& v) {
    emplace<static_cast<std::size_t>(GffFieldType::Vector3)>(label, v);
}

void GffStruct::set_strref(const std::string& label, StrRef v) {
    emplace<static_cast<std::size_t>(GffFieldType::StrRef)>(label, v);
}

bool GffStruct::operator==(const GffStruct& other) const {
    return type_id_ == other.type_id_ && fields_ == other.fields_;
}

bool GffStruct::operator!=(const GffStruct& other) const { return !(*this == other); }

bool operator==(const GffField& a, const GffField& b) {
    return a.label() == b.label() && a.value == b.value;
}

bool operator!=(const GffField& a, const GffField& b) { return !(a == b); }

// ------------------------------
// Document
// ------------------------------

namespace {

struct ContentName {
    GffContent content;
    const char* tag;
};

constexpr std::array<ContentName, 24> kContentNames{{
    {GffContent::GFF, "GFF "}, {GffContent::ARE, "ARE "}, {GffContent::IFO, "IFO "},
    {GffContent::GIT, "GIT "}, {GffContent::UTC, "UTC "}, {GffContent::UTD, "UTD "},
    {GffContent::UTE, "UTE "}, {GffContent::UTI, "UTI "}, {GffContent::UTM, "UTM "},
    {GffContent::UTP, "UTP "}, {GffContent::UTS, "UTS "}, {GffContent::UTT, "UTT "},
    {GffContent::UTW, "UTW "}, {GffContent::DLG, "DLG "}, {GffContent::JRL, "JRL "},
    {GffContent::FAC, "FAC "}, {GffContent::ITP, "ITP "}, {GffContent::GUI, "GUI "},
    {GffContent::PTH, "PTH "}, {GffContent::BIC, "BIC "}, {GffContent::GVT, "GVT "},
    {GffContent::INV, "INV "}, {GffContent::PT, "PT  "}, {GffContent::NFO, "NFO "},
}};

std::string normalize_tag(const std::string& tag) {
    if (tag.size() > 4) {
        throw GffError(ErrorKind::BadFormat, "content tag '" + tag + "' is longer than 4 bytes");
    }
    std::string out = tag;
    out.resize(4, ' ');
    return out;
}

} // namespace

std::string content_tag(GffContent c) {
    for (const auto& n : kContentNames) {
        if (n.content == c) return n.tag;
    }
    return "GFF ";
}

std::optional<GffContent> content_from_tag(const std::string& tag) {
    std::string padded = tag;
    if (padded.size() < 4) padded.resize(4, ' ');
    for (const auto& n : kContentNames) {
        if (padded == n.tag) return n.content;
    }
    return std::nullopt;
}

GffDocument::GffDocument() = default;

GffDocument::GffDocument(GffContent content) : content_tag_(gff::content_tag(content)) {}

GffDocument::GffDocument(const std::string& content_tag) : content_tag_(normalize_tag(content_tag)) {}

const std::string& GffDocument::content_tag() const noexcept { return content_tag_; }

void GffDocument::set_content_tag(const std::string& tag) { content_tag_ = normalize_tag(tag); }

std::optional<GffContent> GffDocument::content() const { return content_from_tag(content_tag_); }

GffStruct& GffDocument::root() noexcept { return root_; }

const GffStruct& GffDocument::root() const noexcept { return root_; }

bool GffDocument::compare(const GffDocument& other, const CompareLog& log) const {
    bool same = true;
    if (content_tag_ != other.content_tag_) {
        if (log) log("content tag differs: '" + content_tag_ + "' vs '" + other.content_tag_ + "'");
        same = false;
    }
    if (!gff::compare(root_, other.root_, log)) same = false;
    return same;
}

bool GffDocument::operator==(const GffDocument& other) const {
    return content_tag_ == other.content_tag_ && root_ == other.root_;
}

bool GffDocument::operator!=(const GffDocument& other) const { return !(*this == other); }

// ------------------------------
// File helpers
// ------------------------------

std::vector<std::uint8_t> read_bytes(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary);
    if (!is) {
        throw GffError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) {
        throw GffError(ErrorKind::Io, "failed reading file: " + file.string());
    }
    return bytes;
}

Header read_header_only(const std::filesystem::path& file, const ReadOptions& opts) {
    std::vector<std::uint8_t> bytes = read_bytes(file);
    return read_header(bytes, opts);
}

GffDocument read_file(const std::filesystem::path& file, const ReadOptions& opts) {
    std::vector<std::uint8_t> bytes = read_bytes(file);
    return decode(bytes, opts);
}

void write_file(const std::filesystem::path& file, const GffDocument& doc, const WriteOptions& opts) {
    // Encode first so a failed encode never truncates an existing file.
    std::vector<std::uint8_t> bytes = encode(doc, opts);

    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw GffError(ErrorKind::Io, "failed to open for write: " + file.string());
    if (!bytes.empty()) {
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!os) throw GffError(ErrorKind::Io, "failed writing GFF file: " + file.string());
}

} // namespace gff
