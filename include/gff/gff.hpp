#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gff {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    BadFormat,
    UnsupportedVersion,
    Truncated,
    OffsetRange,
    UnknownType,
    LabelTooLong,
    ResRefTooLong,
    TypeMismatch,
    NotFound,
};

// Table of the binary layout a problem was found in.
enum class GffRegion {
    None,
    Header,
    Structs,
    Fields,
    Labels,
    FieldData,
    FieldIndices,
    ListIndices,
};

std::string to_string(ErrorKind k);
std::string to_string(GffRegion r);

class GffError : public std::runtime_error {
public:
    GffError(ErrorKind k, const std::string& msg, GffRegion region = GffRegion::None);
    ErrorKind kind() const noexcept;
    GffRegion region() const noexcept;

private:
    ErrorKind kind_;
    GffRegion region_;
};

// ------------------------------
// Field kinds
// ------------------------------

// Numeric values are the on-disk type tags.
enum class GffFieldType : std::uint32_t {
    UInt8 = 0,
    Int8 = 1,
    UInt16 = 2,
    Int16 = 3,
    UInt32 = 4,
    Int32 = 5,
    UInt64 = 6,
    Int64 = 7,
    Single = 8,
    Double = 9,
    String = 10,
    ResRef = 11,
    LocString = 12,
    Binary = 13,
    Struct = 14,
    List = 15,
    Vector4 = 16,
    Vector3 = 17,
    StrRef = 18,
};

inline constexpr std::size_t kFieldTypeCount = 19;
inline constexpr std::size_t kMaxLabelLength = 16;
inline constexpr std::size_t kMaxResRefLength = 16;

std::string to_string(GffFieldType t);

/// True for kinds whose payload lives in the 4-byte slot of the field entry.
bool is_inline(GffFieldType t) noexcept;

// ------------------------------
// Value types
// ------------------------------

class ResRef {
public:
    ResRef() = default;
    /// Throws GffError(ResRefTooLong) for values longer than 16 bytes.
    explicit ResRef(std::string value);

    const std::string& str() const noexcept;
    bool empty() const noexcept;

    bool operator==(const ResRef& other) const noexcept;
    bool operator!=(const ResRef& other) const noexcept;

private:
    std::string value_{};
};

enum class Language : std::uint32_t {
    English = 0,
    French = 1,
    German = 2,
    Italian = 3,
    Spanish = 4,
    Polish = 5,
    Korean = 128,
    ChineseTraditional = 129,
    ChineseSimplified = 130,
    Japanese = 131,
};

enum class Gender : std::uint32_t {
    Male = 0,
    Female = 1,
};

class LocalizedString {
public:
    static constexpr std::int32_t kNoStringRef = -1;

    LocalizedString() = default;
    explicit LocalizedString(std::int32_t stringref);

    static std::uint32_t substring_id(Language lang, Gender gender) noexcept;
    static std::pair<Language, Gender> split_substring_id(std::uint32_t id) noexcept;

    std::int32_t stringref() const noexcept;
    // Any negative id is normalized to kNoStringRef.
    void set_stringref(std::int32_t stringref) noexcept;
    bool has_stringref() const noexcept;

    void set(Language lang, Gender gender, std::string text);
    std::optional<std::string> get(Language lang, Gender gender) const;
    bool remove(Language lang, Gender gender);

    void set_by_id(std::uint32_t id, std::string text);
    std::optional<std::string> get_by_id(std::uint32_t id) const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;

    // Keyed by substring id, iterated in ascending id order.
    const std::map<std::uint32_t, std::string>& substrings() const noexcept;

    bool operator==(const LocalizedString& other) const noexcept;
    bool operator!=(const LocalizedString& other) const noexcept;

private:
    std::int32_t stringref_{kNoStringRef};
    std::map<std::uint32_t, std::string> substrings_{};
};

struct Vector3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
};

struct Vector4 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};
    float w{0.0f};
};

// Id into an external string table.
struct StrRef {
    std::int32_t id{-1};
};

bool operator==(const Vector3& a, const Vector3& b) noexcept;
bool operator!=(const Vector3& a, const Vector3& b) noexcept;
bool operator==(const Vector4& a, const Vector4& b) noexcept;
bool operator!=(const Vector4& a, const Vector4& b) noexcept;
bool operator==(const StrRef& a, const StrRef& b) noexcept;
bool operator!=(const StrRef& a, const StrRef& b) noexcept;

using Binary = std::vector<std::uint8_t>;

class GffStruct;
class GffField;
using GffList = std::vector<GffStruct>;

// ------------------------------
// Struct
// ------------------------------

class GffStruct {
public:
    GffStruct();
    explicit GffStruct(std::int32_t type_id);
    GffStruct(const GffStruct& other);
    GffStruct(GffStruct&& other) noexcept;
    GffStruct& operator=(const GffStruct& other);
    GffStruct& operator=(GffStruct&& other) noexcept;
    ~GffStruct();

    std::int32_t type_id() const noexcept;
    void set_type_id(std::int32_t type_id) noexcept;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    bool exists(const std::string& label) const;
    std::optional<GffFieldType> type_of(const std::string& label) const;

    /// nullptr when the label is absent. Only the value of a returned field
    /// can be changed; labels go through rename().
    const GffField* field(const std::string& label) const;
    GffField* field(const std::string& label);

    bool remove(const std::string& label);

    /// Relabel a field in place. Missing `from` -> NotFound, `to` already used
    /// by another field -> BadFormat, invalid `to` as in validate_label.
    void rename(const std::string& from, const std::string& to);

    const std::vector<GffField>& fields() const noexcept;
    std::vector<GffField>::const_iterator begin() const noexcept;
    std::vector<GffField>::const_iterator end() const noexcept;

    // Typed getters. Missing label -> NotFound, other kind -> TypeMismatch.
    std::uint8_t get_uint8(const std::string& label) const;
    std::int8_t get_int8(const std::string& label) const;
    std::uint16_t get_uint16(const std::string& label) const;
    std::int16_t get_int16(const std::string& label) const;
    std::uint32_t get_uint32(const std::string& label) const;
    std::int32_t get_int32(const std::string& label) const;
    std::uint64_t get_uint64(const std::string& label) const;
    std::int64_t get_int64(const std::string& label) const;
    float get_single(const std::string& label) const;
    double get_double(const std::string& label) const;
    const std::string& get_string(const std::string& label) const;
    const ResRef& get_resref(const std::string& label) const;
    const LocalizedString& get_locstring(const std::string& label) const;
    const Binary& get_binary(const std::string& label) const;
    const GffStruct& get_struct(const std::string& label) const;
    GffStruct& get_struct(const std::string& label);
    const GffList& get_list(const std::string& label) const;
    GffList& get_list(const std::string& label);
    Vector4 get_vector4(const std::string& label) const;
    Vector3 get_vector3(const std::string& label) const;
    StrRef get_strref(const std::string& label) const;

    // Typed setters. An existing label is overwritten in place, otherwise the
    // field is appended. Labels over 16 bytes -> LabelTooLong.
    void set_uint8(const std::string& label, std::uint8_t v);
    void set_int8(const std::string& label, std::int8_t v);
    void set_uint16(const std::string& label, std::uint16_t v);
    void set_int16(const std::string& label, std::int16_t v);
    void set_uint32(const std::string& label, std::uint32_t v);
    void set_int32(const std::string& label, std::int32_t v);
    void set_uint64(const std::string& label, std::uint64_t v);
    void set_int64(const std::string& label, std::int64_t v);
    void set_single(const std::string& label, float v);
    void set_double(const std::string& label, double v);
    void set_string(const std::string& label, std::string v);
    void set_resref(const std::string& label, ResRef v);
    void set_locstring(const std::string& label, LocalizedString v);
    void set_binary(const std::string& label, Binary v);
    GffStruct& set_struct(const std::string& label, GffStruct v);
    GffList& set_list(const std::string& label, GffList v);
    void set_vector4(const std::string& label, const Vector4& v);
    void set_vector3(const std::string& label, const Vector3& v);
    void set_strref(const std::string& label, StrRef v);

    bool operator==(const GffStruct& other) const;
    bool operator!=(const GffStruct& other) const;

private:
    template <std::size_t I, typename V>
    auto& emplace(const std::string& label, V&& v);

    std::int32_t type_id_{0};
    std::vector<GffField> fields_{};
};

/// Throws GffError(LabelTooLong) / GffError(BadFormat) for labels that cannot be stored.
void validate_label(const std::string& label);

// ------------------------------
// Field
// ------------------------------

// Alternative index == GffFieldType tag.
using GffValue = std::variant<
    std::uint8_t,
    std::int8_t,
    std::uint16_t,
    std::int16_t,
    std::uint32_t,
    std::int32_t,
    std::uint64_t,
    std::int64_t,
    float,
    double,
    std::string,
    ResRef,
    LocalizedString,
    Binary,
    GffStruct,
    GffList,
    Vector4,
    Vector3,
    StrRef
>;

static_assert(std::variant_size_v<GffValue> == kFieldTypeCount, "one alternative per type tag");

class GffField {
public:
    const std::string& label() const noexcept { return label_; }
    GffFieldType type() const noexcept { return static_cast<GffFieldType>(value.index()); }

    GffValue value{};

private:
    friend class GffStruct;
    explicit GffField(std::string label) : label_(std::move(label)) {}

    // Unique within the owning struct and valid per validate_label.
    std::string label_{};
};

bool operator==(const GffField& a, const GffField& b);
bool operator!=(const GffField& a, const GffField& b);

/// One-line rendering of a value for diagnostics ("42", "\"text\"", "3 entries").
std::string to_display_string(const GffValue& v);

// ------------------------------
// Document
// ------------------------------

enum class GffContent {
    GFF, ARE, IFO, GIT, UTC, UTD, UTE, UTI, UTM, UTP, UTS, UTT, UTW,
    DLG, JRL, FAC, ITP, GUI, PTH, BIC, GVT, INV, PT, NFO,
};

/// Four-byte, space padded tag for a content kind ("UTC ", "PT  ").
std::string content_tag(GffContent c);
std::optional<GffContent> content_from_tag(const std::string& tag);

using CompareLog = std::function<void(const std::string&)>;

class GffDocument {
public:
    static constexpr std::int32_t kRootTypeId = -1;

    GffDocument();
    explicit GffDocument(GffContent content);
    /// Tags shorter than four bytes are space padded; longer ones -> BadFormat.
    explicit GffDocument(const std::string& content_tag);

    const std::string& content_tag() const noexcept;
    void set_content_tag(const std::string& tag);
    std::optional<GffContent> content() const;

    GffStruct& root() noexcept;
    const GffStruct& root() const noexcept;

    /// Logs every difference through `log`; true when equal.
    bool compare(const GffDocument& other, const CompareLog& log) const;

    bool operator==(const GffDocument& other) const;
    bool operator!=(const GffDocument& other) const;

private:
    std::string content_tag_{"GFF "};
    GffStruct root_{kRootTypeId};
};

/// Structural comparison of two struct trees. Each difference is reported as
/// one line naming its backslash-separated path. True when equal.
bool compare(const GffStruct& a, const GffStruct& b, const CompareLog& log, const std::string& path = {});

// ------------------------------
// Header model
// ------------------------------

inline constexpr std::uint32_t kHeaderSize = 56;
inline constexpr std::uint32_t kStructEntrySize = 12;
inline constexpr std::uint32_t kFieldEntrySize = 12;
inline constexpr std::uint32_t kLabelEntrySize = 16;
inline constexpr std::uint32_t kNoFieldsSlot = 0xFFFFFFFFu;

struct RegionSpan {
    std::uint32_t offset{0};
    // Element count for structs/fields/labels, byte size for the other regions.
    std::uint32_t count{0};
};

struct Header {
    std::string content_tag{"GFF "};
    std::string version{"V3.2"};
    RegionSpan structs{};
    RegionSpan fields{};
    RegionSpan labels{};
    RegionSpan field_data{};
    RegionSpan field_indices{};
    RegionSpan list_indices{};
};

struct ReadOptions {
    bool allow_v33{true};      // accept "V3.3" (same layout as "V3.2")
    bool strict_labels{false}; // reject labels with garbage after the NUL padding
};

struct WriteOptions {
    bool dedupe_field_data{true}; // reuse offsets for identical out-of-line payloads
    std::string version{"V3.2"};
};

// ------------------------------
// API
// ------------------------------

/// Parse and bounds-check the fixed header of an in-memory buffer.
Header read_header(const std::uint8_t* data, std::size_t size, const ReadOptions& opts = ReadOptions{});
Header read_header(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts = ReadOptions{});

/// Read a file and return its header only.
Header read_header_only(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

std::vector<std::uint8_t> encode_header(const Header& header);

/// Decode a whole document. Throws GffError; never returns a partial tree.
GffDocument decode(const std::uint8_t* data, std::size_t size, const ReadOptions& opts = ReadOptions{});
GffDocument decode(const std::vector<std::uint8_t>& bytes, const ReadOptions& opts = ReadOptions{});

/// Encode a document into the canonical layout.
std::vector<std::uint8_t> encode(const GffDocument& doc, const WriteOptions& opts = WriteOptions{});

/// Whole file contents. Throws GffError(Io).
std::vector<std::uint8_t> read_bytes(const std::filesystem::path& file);

/// zlib CRC-32 of a buffer of any length.
std::uint32_t crc32_bytes(const std::uint8_t* data, std::size_t size);

GffDocument read_file(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});
void write_file(const std::filesystem::path& file, const GffDocument& doc, const WriteOptions& opts = WriteOptions{});

} // namespace gff
